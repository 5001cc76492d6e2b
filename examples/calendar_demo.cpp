#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "almanac/calendar_date.h"
#include "almanac/calendars/chinese_calendar.h"
#include "almanac/calendars/japanese_calendar.h"
#include "almanac/config.h"
#include "almanac/engine.h"
#include "almanac/status.h"
#include "almanac/week_fields.h"

int main() {
    auto config = almanac::MakeDefaultConfig();
    std::unique_ptr<almanac::AlmanacEngine> engine;
    auto status = almanac::AlmanacEngine::Create(config, engine);
    if (status != almanac::StatusCode::Ok) {
        std::cout << "Engine creation failed: " << almanac::StatusName(status) << std::endl;
        return 1;
    }

    const almanac::EpochDay day = 18286;
    const std::vector<std::string> variants{
        "coptic",
        "indian",
        "islamic-civil",
        "islamic-umalqura",
        "chinese",
        "japanese",
        "historic-julian",
        "historic-first-reform"
    };
    for (const auto &variant: variants) {
        almanac::CalendarDate date;
        status = engine->FromEpochDay(variant, day, date);
        if (status != almanac::StatusCode::Ok) {
            std::cout << variant << ": " << almanac::StatusName(status) << std::endl;
            continue;
        }
        std::cout << variant << ": " << almanac::FormatDate(date) << std::endl;
    }

    almanac::CalendarSystemPtr chinese;
    status = engine->Calendar("chinese", chinese);
    if (status != almanac::StatusCode::Ok) {
        std::cout << "Chinese calendar unavailable: " << almanac::StatusName(status) << std::endl;
        return 1;
    }
    // 2020-01-24T16:00:00Z is midnight in Beijing.
    const std::int64_t instant = day * 86400LL - 8 * 3600;
    almanac::CalendarDate lunar;
    status = static_cast<const almanac::ChineseCalendar &>(*chinese).FromUtcSeconds(instant, lunar);
    if (status != almanac::StatusCode::Ok) {
        std::cout << "Chinese conversion failed: " << almanac::StatusName(status) << std::endl;
        return 1;
    }
    std::cout << "UTC " << instant << " in Beijing: " << almanac::FormatDate(lunar) << std::endl;

    almanac::CalendarSystemPtr japanese;
    status = engine->Calendar("japanese", japanese);
    if (status != almanac::StatusCode::Ok) {
        std::cout << "Japanese calendar unavailable: " << almanac::StatusName(status) << std::endl;
        return 1;
    }
    // Keio 4/9/8 is the first day of Meiji.
    auto keio = japanese->MakeDate(almanac::JapaneseCalendar::kKeio, 4, almanac::MonthSpec::Regular(9), 8);
    almanac::CalendarDate resolved;
    status = engine->Resolve(keio, resolved);
    if (status != almanac::StatusCode::Ok) {
        std::cout << "Era resolution failed: " << almanac::StatusName(status) << std::endl;
        return 1;
    }
    std::cout << almanac::FormatDate(keio) << " resolves to " << almanac::FormatDate(resolved) << std::endl;

    almanac::CalendarSystemPtr history;
    status = engine->DefaultHistory(history);
    if (status != almanac::StatusCode::Ok) {
        std::cout << "History unavailable: " << almanac::StatusName(status) << std::endl;
        return 1;
    }
    almanac::CalendarDate today;
    status = history->FromEpochDay(day, today);
    if (status != almanac::StatusCode::Ok) {
        return 1;
    }
    std::unique_ptr<almanac::WeekFieldEngine> weeks;
    status = almanac::WeekFieldEngine::Create(history, engine->DefaultWeekModel(), weeks);
    if (status != almanac::StatusCode::Ok) {
        std::cout << "Week fields unavailable: " << almanac::StatusName(status) << std::endl;
        return 1;
    }
    int week = 0;
    status = weeks->Week(today, almanac::WeekPeriod::Year, week);
    if (status != almanac::StatusCode::Ok) {
        return 1;
    }
    std::cout << almanac::FormatDate(today) << " is in week " << week << std::endl;

    std::vector<std::uint8_t> bytes;
    status = engine->Encode(today, bytes);
    if (status != almanac::StatusCode::Ok) {
        std::cout << "Encoding failed: " << almanac::StatusName(status) << std::endl;
        return 1;
    }
    std::cout << "Encoded " << bytes.size() << " bytes" << std::endl;
    return 0;
}
