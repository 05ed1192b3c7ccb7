#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace zuuid::utils {

class Uuid {
public:
    Uuid() = default;
    explicit Uuid(const std::array<std::uint8_t, 16>& bytes);

    // Random bits come from std::random_device (getrandom on Linux).
    [[nodiscard]] static Uuid generate_v4();

    // Unix epoch milliseconds in the top 48 bits followed by a per-thread
    // 12-bit sequence. Values generated by one thread never decrease.
    [[nodiscard]] static Uuid generate_v7();

    // Canonical lowercase 8-4-4-4-12 text.
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] const std::array<std::uint8_t, 16>& bytes() const { return m_bytes; }
    [[nodiscard]] unsigned version() const { return m_bytes[6] >> 4; }
    [[nodiscard]] std::uint64_t timestamp_ms() const;

    bool operator==(const Uuid& other) const { return m_bytes == other.m_bytes; }
    bool operator!=(const Uuid& other) const { return !(*this == other); }
    bool operator<(const Uuid& other) const { return m_bytes < other.m_bytes; }

private:
    std::array<std::uint8_t, 16> m_bytes{};

    static std::random_device& get_random_device();
    static void fill_random(std::array<std::uint8_t, 16>& bytes);
};

}
