#include "registry/manager.hpp"

#include "log/log.hpp"

namespace unijson {

std::mutex RegistryManager::mutex_;
Rc<RegistryManager> RegistryManager::instance_;

RegistryManager::RegistryManager(Rc<ClassRegistry> registry) : registry_(std::move(registry)) {
    if (!registry_) {
        registry_ = make_rc<DefaultClassRegistry>();
    }
    registry_->setup();
}

auto RegistryManager::init(Rc<ClassRegistry> registry) -> Rc<RegistryManager> {
    auto manager = make_rc<RegistryManager>(std::move(registry));
    std::lock_guard<std::mutex> lock(mutex_);
    if (instance_) {
        UNIJSON_LOG_DEBUG("manager", "Replacing the live registry manager");
    }
    instance_ = manager;
    return manager;
}

auto RegistryManager::get_instance() -> Rc<RegistryManager> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!instance_) {
        UNIJSON_LOG_DEBUG("manager", "Creating registry manager with a default class registry");
        instance_ = make_rc<RegistryManager>(nullptr);
    }
    return instance_;
}

auto RegistryManager::get_class_registry() -> Rc<ClassRegistry> {
    return get_instance()->class_registry();
}

auto RegistryManager::has_instance() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return instance_ != nullptr;
}

void RegistryManager::teardown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (instance_) {
        UNIJSON_LOG_DEBUG("manager", "Tearing down registry manager");
    }
    instance_.reset();
}

} // namespace unijson
