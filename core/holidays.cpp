#include "holidays.h"
#include "core_log.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace annum {
    namespace core {
        namespace holidays {
            using namespace std;
            using namespace boost::date_time;

            namespace global {
                const holiday new_years_day("New Year's Day", Jan, 1);
                const holiday st_patricks_day("St. Patrick's Day", Mar, 17);
                const holiday christmas_eve("Christmas Eve", Dec, 24);
                const holiday christmas("Christmas", Dec, 25);
                const holiday new_years_eve("New Year's Eve", Dec, 31);
            }

            namespace united_states {
                const holiday mlkj_day("Martin Luther King Jr. Day", THIRD, Monday, Jan);
                const holiday groundhog_day("Groundhog Day", Feb, 2);
                const holiday superbowl_sunday("Super Bowl Sunday", FIRST, Sunday, Feb);
                const holiday presidents_day("President's Day", THIRD, Monday, Feb);
                const holiday valentines_day("Valentine's Day", Feb, 14);
                const holiday dst_start("Daylight Saving Time Starts", SECOND, Sunday, Mar);
                const holiday april_fools_day("April Fool's Day", Apr, 1);
                const holiday kentucky_derby("Kentucky Derby", FIRST, Saturday, May);
                const holiday memorial_day("Memorial Day", LAST, Monday, May);
                const holiday mothers_day("Mother's Day", SECOND, Sunday, May);
                const holiday flag_day("Flag Day", Jun, 14);
                const holiday fathers_day("Father's Day", THIRD, Sunday, Jun);
                const holiday independence_day("Independence Day", Jul, 4);
                const holiday labor_day("Labor Day", FIRST, Monday, Sep);
                const holiday columbus_day("Columbus Day", SECOND, Monday, Oct);
                const holiday halloween("Halloween", Oct, 31);
                const holiday veterans_day("Veteran's Day", Nov, 11);
                const holiday dst_end("Daylight Saving Time Ends", FIRST, Sunday, Nov);
                const holiday thanksgiving("Thanksgiving", FOURTH, Thursday, Nov);
            }

            /** the lookup table, normalized name -> holiday, built on first use */
            static const map<string, const holiday*>& name_table() {
                using namespace global;
                using namespace united_states;
                static const map<string, const holiday*> table {
                    {"new years", &new_years_day},
                    {"new years eve", &new_years_eve},
                    {"st. patricks", &st_patricks_day},
                    {"st patricks", &st_patricks_day},
                    {"saint patricks", &st_patricks_day},
                    {"martin luther king jr.", &mlkj_day},
                    {"martin luther king jr", &mlkj_day},
                    {"mlk", &mlkj_day},
                    {"groundhog", &groundhog_day},
                    {"superbowl sunday", &superbowl_sunday},
                    {"superbowl", &superbowl_sunday},
                    {"super bowl sunday", &superbowl_sunday},
                    {"presidents", &presidents_day},
                    {"valentines", &valentines_day},
                    {"daylight saving time starts", &dst_start},
                    {"april fools", &april_fools_day},
                    {"kentucky derby", &kentucky_derby},
                    {"memorial", &memorial_day},
                    {"mothers", &mothers_day},
                    {"flag", &flag_day},
                    {"independence", &independence_day},
                    {"july 4th", &independence_day},
                    {"july fourth", &independence_day},
                    {"fourth of july", &independence_day},
                    {"4th of july", &independence_day},
                    {"fathers", &fathers_day},
                    {"labor", &labor_day},
                    {"halloween", &halloween},
                    {"columbus", &columbus_day},
                    {"veterans", &veterans_day},
                    {"daylight saving time ends", &dst_end},
                    {"thanksgiving", &thanksgiving},
                    {"christmas eve", &christmas_eve},
                    {"christmas", &christmas}
                };
                return table;
            }

            static void erase_all(string& s, const string& what) {
                for (auto p = s.find(what); p != string::npos; p = s.find(what, p))
                    s.erase(p, what.size());
            }

            static void trim(string& s) {
                s.erase(s.begin(), find_if(s.begin(), s.end(), [](unsigned char c) { return !isspace(c); }));
                s.erase(find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !isspace(c); }).base(), s.end());
            }

            string normalize_name(const string& text) {
                string s(text);
                transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return char(tolower(c)); });
                erase_all(s, "'");
                erase_all(s, "\xE2\x80\x99");// typographic apostrophe
                trim(s);
                while (s.compare(0, 4, "the ") == 0) {
                    s.erase(0, 4);
                    trim(s);
                }
                while (s.size() >= 4 && s.compare(s.size() - 4, 4, " day") == 0) {
                    s.erase(s.size() - 4);
                    trim(s);
                }
                return s;
            }

            holiday holiday_from_name(const string& text) {
                auto key = normalize_name(text);
                const auto& table = name_table();
                auto f = table.find(key);
                if (f != table.end())
                    return *f->second;
                dlog << dlib::LDEBUG << "no holiday named '" << text << "' (normalized '" << key << "')";
                throw runtime_error(string("holiday '") + text + string("' not found"));
            }

            vector<holiday> holiday_list() {
                using namespace global;
                using namespace united_states;
                return vector<holiday> {
                    new_years_day, mlkj_day, groundhog_day, superbowl_sunday, valentines_day,
                    presidents_day, dst_start, st_patricks_day, april_fools_day, kentucky_derby,
                    mothers_day, memorial_day, flag_day, fathers_day, independence_day,
                    labor_day, columbus_day, halloween, dst_end, veterans_day, thanksgiving,
                    christmas_eve, christmas, new_years_eve
                };
            }
        }
    }
}
