#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace fluent_request::utils {

class Uuid {
public:
    Uuid() = default;
    explicit Uuid(const std::array<std::uint8_t, 16>& bytes);

    [[nodiscard]] static Uuid generate_v4();

    // Canonical 8-4-4-4-12 form, lowercase hex unless requested otherwise
    [[nodiscard]] std::string to_string(bool uppercase = false) const;
    [[nodiscard]] const std::array<std::uint8_t, 16>& bytes() const { return m_bytes; }

    bool operator==(const Uuid& other) const { return m_bytes == other.m_bytes; }
    bool operator!=(const Uuid& other) const { return !(*this == other); }

private:
    std::array<std::uint8_t, 16> m_bytes{};

    static std::mt19937& get_rng();
};

}
