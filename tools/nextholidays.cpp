// nextholidays: list the predefined holidays in the order they occur next
//
//   nextholidays [count]
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <dlib/logger.h>

#include "core/calendar_utilities.h"
#include "core/holidays.h"

using namespace std;
using namespace annum::core;

static dlib::logger dlog("annum.nextholidays");

int main(int argc, char* argv[]) {
    dlib::set_all_logging_levels(getenv("ANNUM_VERBOSE") ? dlib::LALL : dlib::LWARN);
    auto all = holidays::holiday_list();
    size_t count = all.size();
    if (argc > 2) {
        cerr << "usage: " << argv[0] << " [count]\n";
        return 1;
    }
    if (argc == 2) {
        try {
            count = stoul(argv[1]);
        } catch (const logic_error& e) {// invalid_argument or out_of_range
            cerr << "usage: " << argv[0] << " [count], '" << argv[1] << "' is not a count: " << e.what() << "\n";
            return 1;
        }
    }

    auto t = today();
    dlog << dlib::LINFO << "listing " << count << " of " << all.size() << " holidays from " << to_string(t);
    vector<pair<date, holiday>> upcoming;
    upcoming.reserve(all.size());
    for (const auto& h : all)
        upcoming.emplace_back(h.after(t), h);
    sort(upcoming.begin(), upcoming.end(), [](const pair<date, holiday>& a, const pair<date, holiday>& b) {
        return a.first == b.first ? a.second < b.second : a.first < b.first;
    });

    for (size_t i = 0; i < upcoming.size() && i < count; ++i) {
        const auto& u = upcoming[i];
        cout << to_string(u.first) << "  Days until " << u.second.name << ": " << days_between(t, u.first) << "\n";
    }
    return 0;
}
