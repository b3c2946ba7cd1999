#include "response_type.hpp"
#include <cxxabi.h>
#include <cstdlib>
#include <memory>

namespace querybus {

std::string type_name(std::type_index type) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
    if (status != 0 || !demangled) return type.name();
    return demangled.get();
}

} // namespace querybus
