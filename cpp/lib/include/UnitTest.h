/** \file   UnitTest.h
 *  \brief  A minimal unit test harness.  Each test program consists of TEST() blocks followed by TEST_MAIN().
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


#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include "util.h"


namespace UnitTest {


struct TestCase {
    void (*function_)();
    std::string name_;
};


inline std::vector<TestCase> &GetTestCases() {
    static std::vector<TestCase> test_cases;
    return test_cases;
}


struct Counters {
    unsigned success_count_ = 0, failure_count_ = 0;
};


inline Counters &GetCounters() {
    static Counters counters;
    return counters;
}


inline int Register(void (*function)(), const char * const name) {
    GetTestCases().push_back(TestCase{ function, name });
    return 0;
}


inline void RecordOutcome(const bool succeeded, const std::string &description, const char * const file, const int line) {
    if (succeeded)
        ++GetCounters().success_count_;
    else {
        ++GetCounters().failure_count_;
        std::cerr << "\tTest failed (" << file << ':' << line << "): " << description << '\n';
    }
}


inline int RunAll(const char * const program_name) {
    std::cerr << "*** " << program_name << " ***\n";
    for (const auto &test_case : GetTestCases()) {
        std::cerr << "Calling test \"" << test_case.name_ << "\".\n";
        test_case.function_();
    }

    std::cerr << "*** " << GetCounters().success_count_ << " checks succeeded. ***\n";
    std::cerr << "*** " << GetCounters().failure_count_ << " checks failed. ***\n";
    return (GetCounters().failure_count_ > 0) ? EXIT_FAILURE : EXIT_SUCCESS;
}


} // namespace UnitTest


#define TEST_MAIN(name)                      \
    int main(int /*argc*/, char *argv[]) {   \
        ::progname = argv[0];                \
        return UnitTest::RunAll(#name);      \
    }


#define TEST(test_name)                                                            \
    static void test_name();                                                       \
    static const int registered_##test_name(UnitTest::Register(test_name, #test_name)); \
    static void test_name()


#define CHECK_TRUE(a) UnitTest::RecordOutcome(static_cast<bool>(a), std::string(#a) + " is not true!", __FILE__, __LINE__)
#define CHECK_FALSE(a) UnitTest::RecordOutcome(not static_cast<bool>(a), std::string(#a) + " is not false!", __FILE__, __LINE__)

#define CHECK_BINARY_OP(a, op, b) UnitTest::RecordOutcome((a) op (b), std::string(#a " " #op " " #b), __FILE__, __LINE__)

#define CHECK_EQ(a, b) CHECK_BINARY_OP(a, ==, b)
#define CHECK_NE(a, b) CHECK_BINARY_OP(a, !=, b)
#define CHECK_LT(a, b) CHECK_BINARY_OP(a, <, b)
#define CHECK_GT(a, b) CHECK_BINARY_OP(a, >, b)
#define CHECK_LE(a, b) CHECK_BINARY_OP(a, <=, b)
#define CHECK_GE(a, b) CHECK_BINARY_OP(a, >=, b)
