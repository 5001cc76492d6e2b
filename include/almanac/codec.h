#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "almanac/calendar_date.h"
#include "almanac/status.h"

namespace almanac {
    // Stable little-endian record of a calendar date:
    // "ALMD", u32 version, u8 family, u32 variant length + bytes,
    // i32 era, i32 year, i32 month, u8 leap, i32 day.
    class DateCodec {
    public:
        static constexpr std::uint8_t kMagic[4] = {'A', 'L', 'M', 'D'};
        static constexpr std::uint32_t kVersion = 1;

        static StatusCode Encode(const CalendarDate &date, std::vector<std::uint8_t> &outBytes);

        // InvalidArgument for bad magic, version or family tag, truncation and trailing bytes.
        // The fields are not checked against the calendar.
        static StatusCode Decode(const std::uint8_t *data, std::size_t size, CalendarDate &outDate);

        static StatusCode Decode(const std::vector<std::uint8_t> &bytes, CalendarDate &outDate);

        static bool IsKnownFamily(std::uint8_t tag) noexcept;

    private:
        class Writer {
        public:
            explicit Writer(std::vector<std::uint8_t> &buffer) noexcept;

            void WriteUint8(std::uint8_t value);
            void WriteUint32(std::uint32_t value);
            void WriteInt32(std::int32_t value);

        private:
            std::vector<std::uint8_t> &m_Buffer;
        };

        class BinaryCursor {
        public:
            BinaryCursor(const std::uint8_t *ptr, std::size_t length) noexcept;

            bool Read(std::uint8_t &value) noexcept;
            bool Read(std::uint32_t &value) noexcept;
            bool Read(std::int32_t &value) noexcept;
            bool Read(std::string &value);

            bool AtEnd() const noexcept;

        private:
            const std::uint8_t *m_Data;
            std::size_t m_Size;
            std::size_t m_Offset;
        };
    };
}
