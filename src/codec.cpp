#include "almanac/codec.h"

#include <limits>
#include <utility>

namespace almanac {
    DateCodec::Writer::Writer(std::vector<std::uint8_t> &buffer) noexcept : m_Buffer(buffer) {
    }

    void DateCodec::Writer::WriteUint8(std::uint8_t value) {
        m_Buffer.push_back(value);
    }

    void DateCodec::Writer::WriteUint32(std::uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            m_Buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
        }
    }

    void DateCodec::Writer::WriteInt32(std::int32_t value) {
        WriteUint32(static_cast<std::uint32_t>(value));
    }

    DateCodec::BinaryCursor::BinaryCursor(const std::uint8_t *ptr, std::size_t length) noexcept
        : m_Data(ptr),
          m_Size(length),
          m_Offset(0) {
    }

    bool DateCodec::BinaryCursor::Read(std::uint8_t &value) noexcept {
        if (m_Offset >= m_Size) {
            return false;
        }
        value = m_Data[m_Offset];
        m_Offset += 1;
        return true;
    }

    bool DateCodec::BinaryCursor::Read(std::uint32_t &value) noexcept {
        if ((m_Size - m_Offset) < sizeof(std::uint32_t)) {
            return false;
        }
        value = 0;
        for (std::size_t i = 0; i < sizeof(std::uint32_t); ++i) {
            value |= static_cast<std::uint32_t>(m_Data[m_Offset + i]) << (8 * i);
        }
        m_Offset += sizeof(std::uint32_t);
        return true;
    }

    bool DateCodec::BinaryCursor::Read(std::int32_t &value) noexcept {
        std::uint32_t bits = 0;
        if (!Read(bits)) {
            return false;
        }
        value = static_cast<std::int32_t>(bits);
        return true;
    }

    bool DateCodec::BinaryCursor::Read(std::string &value) {
        std::uint32_t length = 0;
        if (!Read(length)) {
            return false;
        }
        if ((m_Size - m_Offset) < length) {
            return false;
        }
        value.assign(reinterpret_cast<const char *>(m_Data + m_Offset), length);
        m_Offset += length;
        return true;
    }

    bool DateCodec::BinaryCursor::AtEnd() const noexcept {
        return m_Offset == m_Size;
    }

    bool DateCodec::IsKnownFamily(std::uint8_t tag) noexcept {
        return tag >= static_cast<std::uint8_t>(CalendarFamily::Coptic) &&
               tag <= static_cast<std::uint8_t>(CalendarFamily::Historic);
    }

    StatusCode DateCodec::Encode(const CalendarDate &date, std::vector<std::uint8_t> &outBytes) {
        auto tag = static_cast<std::uint8_t>(date.family);
        if (!IsKnownFamily(tag) || date.variant.size() > std::numeric_limits<std::uint32_t>::max()) {
            return StatusCode::InvalidArgument;
        }
        std::vector<std::uint8_t> buffer;
        buffer.reserve(sizeof(kMagic) + 22 + date.variant.size());
        Writer writer(buffer);
        for (auto byte: kMagic) {
            writer.WriteUint8(byte);
        }
        writer.WriteUint32(kVersion);
        writer.WriteUint8(tag);
        writer.WriteUint32(static_cast<std::uint32_t>(date.variant.size()));
        buffer.insert(buffer.end(), date.variant.begin(), date.variant.end());
        writer.WriteInt32(date.era);
        writer.WriteInt32(date.year);
        writer.WriteInt32(date.month.number);
        writer.WriteUint8(date.month.leap ? 1u : 0u);
        writer.WriteInt32(date.day);
        outBytes = std::move(buffer);
        return StatusCode::Ok;
    }

    StatusCode DateCodec::Decode(const std::uint8_t *data, std::size_t size, CalendarDate &outDate) {
        if (data == nullptr || size < sizeof(kMagic) + sizeof(std::uint32_t)) {
            return StatusCode::InvalidArgument;
        }
        BinaryCursor cursor(data, size);
        for (auto expected: kMagic) {
            std::uint8_t byte = 0;
            if (!cursor.Read(byte) || byte != expected) {
                return StatusCode::InvalidArgument;
            }
        }
        std::uint32_t version = 0;
        if (!cursor.Read(version) || version != kVersion) {
            return StatusCode::InvalidArgument;
        }
        std::uint8_t tag = 0;
        if (!cursor.Read(tag) || !IsKnownFamily(tag)) {
            return StatusCode::InvalidArgument;
        }
        CalendarDate date{};
        date.family = static_cast<CalendarFamily>(tag);
        std::int32_t era = 0;
        std::int32_t year = 0;
        std::int32_t month = 0;
        std::uint8_t leap = 0;
        std::int32_t day = 0;
        if (!cursor.Read(date.variant) || !cursor.Read(era) || !cursor.Read(year) || !cursor.Read(month) ||
            !cursor.Read(leap) || !cursor.Read(day)) {
            return StatusCode::InvalidArgument;
        }
        if (leap > 1 || !cursor.AtEnd()) {
            return StatusCode::InvalidArgument;
        }
        date.era = era;
        date.year = year;
        date.month = MonthSpec{month, leap == 1};
        date.day = day;
        outDate = std::move(date);
        return StatusCode::Ok;
    }

    StatusCode DateCodec::Decode(const std::vector<std::uint8_t> &bytes, CalendarDate &outDate) {
        return Decode(bytes.data(), bytes.size(), outDate);
    }
}
