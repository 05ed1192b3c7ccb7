#include "zuuid/utils/uuid.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace zuuid::utils {

namespace {

constexpr std::uint16_t kMaxSequence = 0x0FFF;

struct V7State {
    std::uint64_t last_ms = 0;
    std::uint16_t sequence = 0;
};

V7State& v7_state() {
    static thread_local V7State state;
    return state;
}

std::uint64_t unix_millis() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

void set_variant(std::array<std::uint8_t, 16>& bytes) {
    // Variant (2 bits) to 10 (RFC 9562 variant)
    bytes[8] = (bytes[8] & 0x3F) | 0x80;
}

}

Uuid::Uuid(const std::array<std::uint8_t, 16>& bytes) : m_bytes(bytes) {}

Uuid Uuid::generate_v4() {
    std::array<std::uint8_t, 16> bytes{};
    fill_random(bytes);

    // Set version (4 bits) to 4 (random UUID)
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    set_variant(bytes);

    return Uuid(bytes);
}

Uuid Uuid::generate_v7() {
    auto& state = v7_state();
    const auto now = unix_millis();

    if (now > state.last_ms) {
        state.last_ms = now;
        // Start low in the sequence space so the counter rarely overflows
        state.sequence = static_cast<std::uint16_t>(get_random_device()() & 0x07FF);
    } else if (state.sequence < kMaxSequence) {
        ++state.sequence;
    } else {
        // Sequence exhausted: borrow the next millisecond instead of wrapping.
        ++state.last_ms;
        state.sequence = 0;
    }

    std::array<std::uint8_t, 16> bytes{};
    fill_random(bytes);

    const auto ms = state.last_ms;
    for (std::size_t i = 0; i < 6; ++i) {
        bytes[i] = static_cast<std::uint8_t>(ms >> (8 * (5 - i)));
    }

    bytes[6] = static_cast<std::uint8_t>(0x70 | ((state.sequence >> 8) & 0x0F));
    bytes[7] = static_cast<std::uint8_t>(state.sequence & 0xFF);
    set_variant(bytes);

    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < m_bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<unsigned>(m_bytes[i]);
    }

    return oss.str();
}

std::uint64_t Uuid::timestamp_ms() const {
    std::uint64_t ms = 0;
    for (std::size_t i = 0; i < 6; ++i) {
        ms = (ms << 8) | m_bytes[i];
    }
    return ms;
}

std::random_device& Uuid::get_random_device() {
    static thread_local std::random_device rd;
    return rd;
}

void Uuid::fill_random(std::array<std::uint8_t, 16>& bytes) {
    auto& rd = get_random_device();
    for (std::size_t i = 0; i < bytes.size(); i += 4) {
        const auto word = static_cast<std::uint32_t>(rd());
        bytes[i] = static_cast<std::uint8_t>(word);
        bytes[i + 1] = static_cast<std::uint8_t>(word >> 8);
        bytes[i + 2] = static_cast<std::uint8_t>(word >> 16);
        bytes[i + 3] = static_cast<std::uint8_t>(word >> 24);
    }
}

}
