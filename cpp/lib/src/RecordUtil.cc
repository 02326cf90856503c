/** \file   RecordUtil.cc
 *  \brief  Implementation of the flat record utility functions.
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
#include "RecordUtil.h"
#include <fstream>
#include <set>
#include <nlohmann/json.hpp>
#include "FileUtil.h"
#include "StringUtil.h"
#include "TextUtil.h"


namespace RecordUtil {


FlatRecord ProjectFields(const FlatRecord &record, const std::vector<std::string> &field_names) {
    if (field_names.empty())
        return record;

    FlatRecord projected_record;
    for (const auto &field_name : field_names) {
        const auto field(record.find(field_name));
        projected_record[field_name] = (field == record.cend()) ? "" : field->second;
    }

    return projected_record;
}


std::vector<std::string> CollectFieldNames(const std::vector<FlatRecord> &records) {
    std::set<std::string> field_names;
    for (const auto &record : records) {
        for (const auto &field : record)
            field_names.emplace(field.first);
    }

    return std::vector<std::string>(field_names.cbegin(), field_names.cend());
}


void WriteJSON(const std::vector<FlatRecord> &records, std::ostream &output) {
    const auto field_names(CollectFieldNames(records));

    nlohmann::json array(nlohmann::json::array());
    for (const auto &record : records) {
        nlohmann::json object(nlohmann::json::object());
        for (const auto &field_name : field_names) {
            const auto field(record.find(field_name));
            object[field_name] = (field == record.cend()) ? "" : field->second;
        }
        array.push_back(object);
    }

    // The replace error handler keeps truncated UTF-8 sequences from aborting the whole dump.
    output << array.dump(2, ' ', /* ensure_ascii = */ false, nlohmann::json::error_handler_t::replace) << '\n';
}


void WriteCSV(const std::vector<FlatRecord> &records, std::ostream &output) {
    const auto field_names(CollectFieldNames(records));

    std::vector<std::string> header;
    for (const auto &field_name : field_names)
        header.emplace_back(TextUtil::CSVEscape(field_name));
    output << StringUtil::Join(header, ",") << "\r\n";

    for (const auto &record : records) {
        std::vector<std::string> values;
        for (const auto &field_name : field_names) {
            const auto field(record.find(field_name));
            values.emplace_back((field == record.cend()) ? "" : TextUtil::CSVEscape(field->second));
        }
        output << StringUtil::Join(values, ",") << "\r\n";
    }
}


bool WriteRecordsToFile(const std::vector<FlatRecord> &records, const std::string &path, std::string * const error_message) {
    const std::string directory(FileUtil::GetDirname(path));
    if (not directory.empty() and not FileUtil::IsDirectory(directory)
        and not FileUtil::MakeDirectory(directory, /* recursive = */ true))
    {
        *error_message = "can't create directory \"" + directory + "\"";
        return false;
    }

    std::ofstream output(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (not output) {
        *error_message = "can't open \"" + path + "\" for writing";
        return false;
    }

    if (StringUtil::EndsWith(path, ".csv", /* ignore_case = */ true))
        WriteCSV(records, output);
    else
        WriteJSON(records, output);

    output.close();
    if (output.fail()) {
        *error_message = "failed to write \"" + path + "\"";
        return false;
    }

    return true;
}


bool ReadRecords(const std::string &path, std::vector<FlatRecord> * const records, std::string * const error_message) {
    records->clear();

    std::string json_text;
    if (not FileUtil::ReadString(path, &json_text)) {
        *error_message = "can't read \"" + path + "\"";
        return false;
    }

    const nlohmann::json array(nlohmann::json::parse(json_text, /* callback = */ nullptr, /* allow_exceptions = */ false));
    if (array.is_discarded() or not array.is_array()) {
        *error_message = "\"" + path + "\" does not contain a JSON array";
        return false;
    }

    for (const auto &object : array) {
        if (not object.is_object()) {
            *error_message = "\"" + path + "\" contains an array element that is not an object";
            return false;
        }

        FlatRecord record;
        for (auto field(object.cbegin()); field != object.cend(); ++field) {
            if (field.value().is_string())
                record[field.key()] = field.value().get<std::string>();
            else if (not field.value().is_null())
                record[field.key()] = field.value().dump();
        }
        records->emplace_back(record);
    }

    return true;
}


} // namespace RecordUtil
