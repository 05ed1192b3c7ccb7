#include "zuuid/services/uuid_generator.hpp"
#include "zuuid/utils/uuid.hpp"

namespace zuuid {
namespace services {

namespace {

class SystemUuidGenerator : public UuidGenerator {
public:
    std::string generate(core::UuidVersion version) override {
        switch (version) {
            case core::UuidVersion::V7:
                return utils::Uuid::generate_v7().to_string();
            case core::UuidVersion::V4:
                break;
        }
        return utils::Uuid::generate_v4().to_string();
    }
};

} // namespace

std::unique_ptr<UuidGenerator> create_uuid_generator() {
    return std::make_unique<SystemUuidGenerator>();
}

} // namespace services
} // namespace zuuid
