/** \file   RecordUtil.h
 *  \brief  Flat records, i.e. string to string maps, and their serialisation as JSON or CSV.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <map>
#include <ostream>
#include <string>
#include <vector>


namespace RecordUtil {


// Keys are iterated in sorted order.
typedef std::map<std::string, std::string> FlatRecord;


/** \return A copy of "record" that only contains the keys listed in "field_names".  Keys missing in "record" are
 *          added with empty values.  An empty "field_names" list selects all fields.
 */
FlatRecord ProjectFields(const FlatRecord &record, const std::vector<std::string> &field_names);


/** \return The sorted union of the keys of all "records". */
std::vector<std::string> CollectFieldNames(const std::vector<FlatRecord> &records);


/** \brief Writes "records" as a JSON array of objects.  Each object has all keys of CollectFieldNames(records). */
void WriteJSON(const std::vector<FlatRecord> &records, std::ostream &output);


/** \brief Writes "records" as CSV with a header line.  Columns are the keys of CollectFieldNames(records). */
void WriteCSV(const std::vector<FlatRecord> &records, std::ostream &output);


/** \brief  Writes "records" to "path" as CSV if "path" ends in ".csv" and as JSON otherwise.
 *  \return False if "path" could not be written.
 */
bool WriteRecordsToFile(const std::vector<FlatRecord> &records, const std::string &path, std::string * const error_message);


/** \brief  Reads a JSON array of objects as written by WriteJSON().  Non-string values are converted to their JSON text.
 *  \return False if "path" could not be read or does not contain an array of objects.
 */
bool ReadRecords(const std::string &path, std::vector<FlatRecord> * const records, std::string * const error_message);


} // namespace RecordUtil
