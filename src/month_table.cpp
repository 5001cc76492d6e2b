#include "almanac/month_table.h"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <unordered_map>

namespace almanac {
    namespace {
        constexpr std::string_view kDefaultVersion = "1.0";
        constexpr std::string_view kLeapSuffix = ".leap";

        std::string_view Trim(std::string_view text) noexcept {
            while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\r')) {
                text.remove_prefix(1);
            }
            while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
                text.remove_suffix(1);
            }
            return text;
        }

        std::string_view Unquote(std::string_view text) noexcept {
            text = Trim(text);
            if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
                text = Trim(text.substr(1, text.size() - 2));
            }
            return text;
        }

        bool ParseInt(std::string_view text, int &outValue) noexcept {
            if (!text.empty() && text.front() == '+') {
                text.remove_prefix(1);
            }
            if (text.empty()) {
                return false;
            }
            auto result = std::from_chars(text.data(), text.data() + text.size(), outValue);
            return result.ec == std::errc() && result.ptr == text.data() + text.size();
        }

        bool SplitTokens(std::string_view text, std::vector<int> &outValues) {
            outValues.clear();
            std::size_t pos = 0;
            while (pos < text.size()) {
                while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
                    ++pos;
                }
                if (pos >= text.size()) {
                    break;
                }
                std::size_t end = pos;
                while (end < text.size() && text[end] != ' ' && text[end] != '\t') {
                    ++end;
                }
                int value = 0;
                if (!ParseInt(text.substr(pos, end - pos), value) || value <= 0) {
                    return false;
                }
                outValues.push_back(value);
                pos = end;
            }
            return true;
        }

        StatusCode ReadProperties(std::string_view text, std::unordered_map<std::string, std::string> &outEntries) {
            outEntries.clear();
            std::size_t pos = 0;
            while (pos <= text.size()) {
                std::size_t end = text.find('\n', pos);
                if (end == std::string_view::npos) {
                    end = text.size();
                }
                auto line = Trim(text.substr(pos, end - pos));
                pos = end + 1;
                if (line.empty() || line.front() == '#' || line.front() == '!') {
                    continue;
                }
                auto equal = line.find('=');
                if (equal == std::string_view::npos) {
                    return StatusCode::ResourceFormatError;
                }
                auto key = Unquote(line.substr(0, equal));
                auto value = Unquote(line.substr(equal + 1));
                if (key.empty()) {
                    return StatusCode::ResourceFormatError;
                }
                outEntries[std::string(key)] = std::string(value);
            }
            return StatusCode::Ok;
        }
    }

    MonthTable::MonthTable()
        : m_Variant(),
          m_Version(),
          m_MinYear(0),
          m_MaxYear(-1),
          m_Lengths(),
          m_Starts(),
          m_YearOffsets(),
          m_LeapMonths() {
    }

    StatusCode MonthTable::Parse(std::string_view text, std::string_view variant, MonthTable &outTable) {
        std::unordered_map<std::string, std::string> entries;
        auto status = ReadProperties(text, entries);
        if (status != StatusCode::Ok) {
            return status;
        }
        auto typeIt = entries.find("type");
        if (typeIt == entries.end() || typeIt->second != variant) {
            return StatusCode::ResourceFormatError;
        }
        std::string version(kDefaultVersion);
        auto versionIt = entries.find("version");
        if (versionIt != entries.end() && !versionIt->second.empty()) {
            version = versionIt->second;
        }
        auto startIt = entries.find("iso-start");
        auto minIt = entries.find("min");
        auto maxIt = entries.find("max");
        if (startIt == entries.end() || minIt == entries.end() || maxIt == entries.end()) {
            return StatusCode::ResourceFormatError;
        }
        EpochDay firstDay = 0;
        int minYear = 0;
        int maxYear = 0;
        if (!ParseIsoDate(startIt->second, firstDay) || !ParseInt(minIt->second, minYear) ||
            !ParseInt(maxIt->second, maxYear) || maxYear < minYear) {
            return StatusCode::ResourceFormatError;
        }

        // Every year needs its own row, so a span wider than the entry count is malformed.
        std::int64_t span = static_cast<std::int64_t>(maxYear) - minYear + 1;
        if (span > static_cast<std::int64_t>(entries.size())) {
            return StatusCode::ResourceFormatError;
        }
        std::vector<YearRow> rows;
        rows.reserve(static_cast<std::size_t>(span));
        for (std::int64_t offset = 0; offset < span; ++offset) {
            int year = static_cast<int>(minYear + offset);
            auto key = std::to_string(year);
            auto rowIt = entries.find(key);
            if (rowIt == entries.end()) {
                return StatusCode::ResourceFormatError;
            }
            YearRow row{year, 0, {}};
            auto leapIt = entries.find(key + std::string(kLeapSuffix));
            if (leapIt != entries.end()) {
                if (!ParseInt(leapIt->second, row.leapMonth) || row.leapMonth < 1 || row.leapMonth > 12) {
                    return StatusCode::ResourceFormatError;
                }
            }
            if (!SplitTokens(rowIt->second, row.lengths)) {
                return StatusCode::ResourceFormatError;
            }
            rows.push_back(std::move(row));
        }
        return Build(variant, version, firstDay, rows, outTable);
    }

    StatusCode MonthTable::Load(const std::string &path, std::string_view variant, MonthTable &outTable) {
        std::ifstream input(path, std::ios::in | std::ios::binary);
        if (!input.is_open()) {
            return StatusCode::NotFound;
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        if (input.bad()) {
            return StatusCode::ResourceFormatError;
        }
        return Parse(buffer.str(), variant, outTable);
    }

    StatusCode MonthTable::Build(std::string_view variant,
                                 std::string_view version,
                                 EpochDay firstDay,
                                 const std::vector<YearRow> &rows,
                                 MonthTable &outTable) {
        if (rows.empty()) {
            return StatusCode::ResourceFormatError;
        }
        MonthTable table;
        table.m_Variant = std::string(variant);
        table.m_Version = std::string(version);
        table.m_MinYear = rows.front().year;
        table.m_MaxYear = rows.back().year;
        table.m_YearOffsets.reserve(rows.size() + 1);
        table.m_LeapMonths.reserve(rows.size());
        EpochDay start = firstDay;
        int expectedYear = table.m_MinYear;
        for (const auto &row: rows) {
            std::size_t expected = row.leapMonth == 0 ? 12u : 13u;
            if (row.year != expectedYear || row.lengths.size() != expected) {
                return StatusCode::ResourceFormatError;
            }
            table.m_YearOffsets.push_back(table.m_Lengths.size());
            table.m_LeapMonths.push_back(row.leapMonth);
            for (int length: row.lengths) {
                if (length <= 0) {
                    return StatusCode::ResourceFormatError;
                }
                table.m_Starts.push_back(start);
                table.m_Lengths.push_back(length);
                start += length;
            }
            ++expectedYear;
        }
        table.m_YearOffsets.push_back(table.m_Lengths.size());
        outTable = std::move(table);
        return StatusCode::Ok;
    }

    const std::string &MonthTable::Variant() const noexcept {
        return m_Variant;
    }

    const std::string &MonthTable::Version() const noexcept {
        return m_Version;
    }

    int MonthTable::MinYear() const noexcept {
        return m_MinYear;
    }

    int MonthTable::MaxYear() const noexcept {
        return m_MaxYear;
    }

    EpochDay MonthTable::FirstDay() const noexcept {
        return m_Starts.empty() ? 0 : m_Starts.front();
    }

    EpochDay MonthTable::LastDay() const noexcept {
        return m_Starts.empty() ? -1 : m_Starts.back() + m_Lengths.back() - 1;
    }

    bool MonthTable::Empty() const noexcept {
        return m_Starts.empty();
    }

    std::size_t MonthTable::Search(EpochDay day) const noexcept {
        std::size_t low = 0;
        std::size_t high = m_Starts.size();
        while (low < high) {
            std::size_t middle = low + (high - low) / 2;
            if (m_Starts[middle] <= day) {
                low = middle + 1;
            } else {
                high = middle;
            }
        }
        return low == 0 ? 0 : low - 1;
    }

    StatusCode MonthTable::Locate(EpochDay day, int &outYear, MonthSpec &outMonth, int &outDay) const {
        if (Empty() || day < FirstDay() || day > LastDay()) {
            return StatusCode::OutOfRange;
        }
        auto index = Search(day);
        auto yearIt = std::upper_bound(m_YearOffsets.begin(), m_YearOffsets.end() - 1, index);
        auto yearIndex = static_cast<std::size_t>(std::distance(m_YearOffsets.begin(), yearIt)) - 1;
        int ordinal = static_cast<int>(index - m_YearOffsets[yearIndex]) + 1;
        outYear = m_MinYear + static_cast<int>(yearIndex);
        auto status = MonthAt(outYear, ordinal, outMonth);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDay = static_cast<int>(day - m_Starts[index]) + 1;
        return StatusCode::Ok;
    }

    StatusCode MonthTable::StartOf(int year, MonthSpec month, EpochDay &outDay) const {
        std::size_t index = 0;
        auto status = IndexOf(year, month, index);
        if (status != StatusCode::Ok) {
            return status;
        }
        outDay = m_Starts[index];
        return StatusCode::Ok;
    }

    StatusCode MonthTable::LengthOf(int year, MonthSpec month, int &outLength) const {
        std::size_t index = 0;
        auto status = IndexOf(year, month, index);
        if (status != StatusCode::Ok) {
            return status;
        }
        outLength = m_Lengths[index];
        return StatusCode::Ok;
    }

    StatusCode MonthTable::LengthOfYear(int year, int &outLength) const {
        if (!HasYear(year)) {
            return StatusCode::OutOfRange;
        }
        auto yearIndex = static_cast<std::size_t>(year - m_MinYear);
        int total = 0;
        for (auto i = m_YearOffsets[yearIndex]; i < m_YearOffsets[yearIndex + 1]; ++i) {
            total += m_Lengths[i];
        }
        outLength = total;
        return StatusCode::Ok;
    }

    StatusCode MonthTable::MonthAt(int year, int ordinal, MonthSpec &outMonth) const {
        if (!HasYear(year)) {
            return StatusCode::OutOfRange;
        }
        int count = MonthsInYear(year);
        if (ordinal < 1 || ordinal > count) {
            return StatusCode::InvalidDate;
        }
        int leap = LeapMonth(year);
        if (leap == 0 || ordinal <= leap) {
            outMonth = MonthSpec::Regular(ordinal);
        } else if (ordinal == leap + 1) {
            outMonth = MonthSpec::Leap(leap);
        } else {
            outMonth = MonthSpec::Regular(ordinal - 1);
        }
        return StatusCode::Ok;
    }

    int MonthTable::LeapMonth(int year) const noexcept {
        if (!HasYear(year)) {
            return 0;
        }
        return m_LeapMonths[static_cast<std::size_t>(year - m_MinYear)];
    }

    int MonthTable::MonthsInYear(int year) const noexcept {
        if (!HasYear(year)) {
            return 0;
        }
        auto yearIndex = static_cast<std::size_t>(year - m_MinYear);
        return static_cast<int>(m_YearOffsets[yearIndex + 1] - m_YearOffsets[yearIndex]);
    }

    int MonthTable::MonthOrdinal(int year, MonthSpec month) const noexcept {
        if (!HasYear(year) || month.number < 1 || month.number > 12) {
            return 0;
        }
        int leap = LeapMonth(year);
        if (month.leap) {
            return (leap != 0 && leap == month.number) ? month.number + 1 : 0;
        }
        return (leap != 0 && month.number > leap) ? month.number + 1 : month.number;
    }

    StatusCode MonthTable::ShiftMonthStart(int year, MonthSpec month, int delta) {
        std::size_t index = 0;
        auto status = IndexOf(year, month, index);
        if (status != StatusCode::Ok) {
            return status;
        }
        if (delta == 0) {
            return StatusCode::Ok;
        }
        if (index == 0) {
            return StatusCode::InvalidArgument;
        }
        if (m_Lengths[index - 1] + delta <= 0 || m_Lengths[index] - delta <= 0) {
            return StatusCode::InvalidArgument;
        }
        m_Lengths[index - 1] += delta;
        m_Lengths[index] -= delta;
        m_Starts[index] += delta;
        return StatusCode::Ok;
    }

    StatusCode MonthTable::IndexOf(int year, MonthSpec month, std::size_t &outIndex) const {
        if (!HasYear(year)) {
            return StatusCode::OutOfRange;
        }
        int ordinal = MonthOrdinal(year, month);
        if (ordinal == 0 || ordinal > MonthsInYear(year)) {
            return StatusCode::InvalidDate;
        }
        outIndex = m_YearOffsets[static_cast<std::size_t>(year - m_MinYear)] + static_cast<std::size_t>(ordinal - 1);
        return StatusCode::Ok;
    }

    bool MonthTable::HasYear(int year) const noexcept {
        return !m_LeapMonths.empty() && year >= m_MinYear && year <= m_MaxYear;
    }
}
