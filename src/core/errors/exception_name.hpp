#pragma once
#include <cstdlib>
#include <cxxabi.h>
#include <exception>
#include <string>
#include <typeinfo>

namespace facetmcp::core::errors {

    // Demangled dynamic type of a caught exception, e.g. "nlohmann::json_abi_v3_11_2::detail::type_error".
    inline std::string exception_type_name(const std::exception& e) {
        const char* mangled = typeid(e).name();
        int status = 0;
        char* demangled_ptr = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
        if (demangled_ptr == nullptr || status != 0) {
            return std::string{mangled};
        }

        std::string demangled{demangled_ptr};
        std::free(demangled_ptr);
        return demangled;
    }

} // namespace facetmcp::core::errors
