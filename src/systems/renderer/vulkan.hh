#pragma once

#include "types.hh"
#include "error.hh"

#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>

#include <fmt/core.h>

#define VULKAN_HPP_NO_EXCEPTIONS
#define VULKAN_HPP_NO_CONSTRUCTORS
#define VULKAN_HPP_DISPATCH_LOADER_DYNAMIC 1
#define VULKAN_HPP_ASSERT_ON_RESULT(expr)
#include <vulkan/vulkan.hpp>

#include "vk_mem_alloc.hpp"

#define RUNE_V VK_MAKE_API_VERSION(0, 0, 1, 0)

#define RUNE_VK_CHECK(x) ::rune::expect(fmt::format("{} @ {}_{}", #x, __FILE__, __LINE__), static_cast<vk::Result>(x))

namespace rune {

    //_____________________________________
    inline ErrorKind error_kind(vk::Result result) {
        switch( result ) {
            case vk::Result::eErrorOutOfHostMemory:
            case vk::Result::eErrorOutOfDeviceMemory:
            case vk::Result::eErrorOutOfPoolMemory:
            case vk::Result::eErrorFragmentedPool:
            case vk::Result::eErrorTooManyObjects:
                return ErrorKind::eResourceExhausted;
            case vk::Result::eTimeout:
                return ErrorKind::eTimeout;
            case vk::Result::eErrorDeviceLost:
                return ErrorKind::eDeviceLost;
            default:
                return ErrorKind::eApiFailure;
        }
    }

    //_____________________________________
    inline void expect(std::string_view msg, vk::Result result) {
        if( result != vk::Result::eSuccess ) {
            throw Error(error_kind(result), fmt::format("{} :: {}", msg, vk::to_string(result)));
        }
    }

    inline void expect(std::string_view msg, VkResult result) {
        expect(msg, static_cast<vk::Result>(result));
    }

    template <typename T>
    T expect(std::string_view msg, vk::ResultValue<T> result) {
        expect(msg, result.result);
        return std::move(result.value);
    }

    inline void expect(std::string_view msg, bool value) {
        if( !value ) {
            throw Error(ErrorKind::eInvariantViolation, std::string(msg));
        }
    }

    template <typename T>
    T* expect(std::string_view msg, T* value) {
        if( value == nullptr ) {
            throw Error(ErrorKind::eInvariantViolation, fmt::format("{} :: null {}", msg, typeid(T).name()));
        }
        return value;
    }
}
