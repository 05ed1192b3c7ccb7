#pragma once

#include "zuuid/core/models.hpp"
#include <memory>
#include <string>

namespace zuuid {
namespace services {

// Source of canonical UUID text (lowercase, hyphenated, 36 characters).
class UuidGenerator {
public:
    virtual ~UuidGenerator() = default;

    virtual std::string generate(core::UuidVersion version) = 0;
};

// Default implementation backed by utils::Uuid.
std::unique_ptr<UuidGenerator> create_uuid_generator();

} // namespace services
} // namespace zuuid
