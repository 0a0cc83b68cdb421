// daysto: print the number of days until holidays or dates
//
//   daysto thanksgiving "the 4th of july" 2030-01-01
//
// Each argument is first looked up as a holiday name, then parsed as a plain date.
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <dlib/logger.h>

#include "core/calendar_utilities.h"
#include "core/holidays.h"

using namespace std;
using namespace annum::core;

static dlib::logger dlog("annum.daysto");

static bool lookup_holiday(const string& arg, holiday& h) {
    try {
        h = holidays::holiday_from_name(arg);
        return true;
    } catch (const runtime_error& e) {
        dlog << dlib::LDEBUG << e.what();
        return false;
    }
}

static bool lookup_date(const string& arg, date& d) {
    try {
        d = parse_date(arg);
        return true;
    } catch (const runtime_error& e) {
        dlog << dlib::LDEBUG << e.what();
        return false;
    }
}

int main(int argc, char* argv[]) {
    dlib::set_all_logging_levels(getenv("ANNUM_VERBOSE") ? dlib::LALL : dlib::LWARN);
    if (argc < 2) {
        cerr << "usage: " << argv[0] << " <holiday name or date>...\n"
             << "  e.g. " << argv[0] << " thanksgiving \"the 4th of july\" 2030-01-01\n";
        return 1;
    }
    int failures = 0;
    for (int i = 1; i < argc; ++i) {
        string arg(argv[i]);
        holiday h;
        date d;
        if (lookup_holiday(arg, h)) {
            auto next = h.after_today();
            dlog << dlib::LINFO << "'" << arg << "' resolved to " << h << ", next " << to_string(next);
            cout << "Days until " << h.name << ": " << days_until(next) << "\n";
        } else if (lookup_date(arg, d)) {
            dlog << dlib::LINFO << "'" << arg << "' parsed as date " << to_string(d);
            cout << "Days until " << arg << ": " << days_until(d) << "\n";
        } else {
            cerr << "Unknown holiday: '" << arg << "'\n";
            ++failures;
        }
    }
    return failures ? 1 : 0;
}
