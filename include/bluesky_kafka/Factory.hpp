/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_FACTORY_HPP
#define BLUESKY_KAFKA_FACTORY_HPP

#include <bluesky_kafka/ForwardDcl.hpp>
#include <bluesky_kafka/Exception.hpp>
#include <dlfcn.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace bluesky_kafka {

/**
 * @brief Process-wide registry of named implementations of Base.
 *
 * Implementations register themselves at static-initialization time
 * (see BLUESKY_KAFKA_REGISTER_IMPLEMENTATION_FOR). A key of the form
 * "name:/path/to/library.so" loads the library first when "name" is
 * not registered yet, so that its registrars can run.
 */
template <typename Base>
class Factory {

    public:

    using Creator = std::function<std::unique_ptr<Base>()>;

    static std::unique_ptr<Base> create(const std::string& key) {
        auto sep  = key.find(':');
        auto name = key.substr(0, sep);
        if(sep != std::string::npos && !contains(name))
            loadLibrary(key.substr(sep + 1));
        auto& creators = registry();
        auto it = creators.find(name);
        if(it == creators.end())
            throw Exception{"No implementation registered under \"" + name + "\""};
        return it->second();
    }

    static bool contains(const std::string& name) {
        return registry().count(name) != 0;
    }

    static std::vector<std::string> names() {
        std::vector<std::string> result;
        for(auto& p : registry()) result.push_back(p.first);
        return result;
    }

    static void add(const std::string& name, Creator creator) {
        registry()[name] = std::move(creator);
    }

    private:

    static std::map<std::string, Creator>& registry() {
        static std::map<std::string, Creator> creators;
        return creators;
    }

    static void loadLibrary(const std::string& path) {
        if(dlopen(path.c_str(), RTLD_NOW | RTLD_GLOBAL)) return;
        const char* err = dlerror();
        throw Exception{"Could not load library \"" + path + "\": "
                        + (err ? err : "unknown error")};
    }
};

/**
 * @brief Adds Derived::create to FactoryType under the given name
 * when constructed.
 */
template <typename FactoryType, typename Derived>
struct Registrar {

    explicit Registrar(const std::string& name) {
        FactoryType::add(name, &Derived::create);
    }
};

}

#define BLUESKY_KAFKA_REGISTER_IMPLEMENTATION_FOR(__factory__, __derived__, __name__) \
    static ::bluesky_kafka::Registrar<__factory__, __derived__> \
    __blueskyKafkaRegistrarFor ## __factory__ ## _ ## __derived__ ## _ ## __name__{#__name__}

#endif
