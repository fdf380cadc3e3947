// registry.hpp
#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Process-wide list of factories for one plugin family (parsers, extractors).
// Entries are added from static initializers, see REGISTER_COMPONENT.
template <typename Base>
class Registry {
public:
    using Creator = std::function<std::unique_ptr<Base>()>;

    static Registry& instance() {
        static Registry registry;
        return registry;
    }

    void add(Creator creator) {
        creators.push_back(std::move(creator));
    }

    std::vector<std::unique_ptr<Base>> createAll() const {
        std::vector<std::unique_ptr<Base>> result;
        for (const auto& creator : creators) {
            result.push_back(creator());
        }
        return result;
    }

    // nullptr when nothing registered under that name
    std::unique_ptr<Base> create(const std::string& name) const {
        for (const auto& creator : creators) {
            auto candidate = creator();
            if (candidate->name() == name)
                return candidate;
        }
        return nullptr;
    }

private:
    std::vector<Creator> creators;
};

#define REGISTER_COMPONENT(REGISTRY, CLASSNAME) \
    namespace { \
        struct CLASSNAME##_AutoRegister { \
            CLASSNAME##_AutoRegister() { \
                REGISTRY::instance().add([]() { \
                    return std::make_unique<CLASSNAME>(); \
                }); \
            } \
        }; \
        static CLASSNAME##_AutoRegister global_##CLASSNAME##_AutoRegister; \
    }
