#pragma once
#include <glyphvault/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace glyphvault::blake3 {

glyphvault::schema::hash32_t hash(const std::string_view& str);
glyphvault::schema::hash32_t hash(
    const glyphvault::schema::bytes_view_t& bytes);

}  // namespace glyphvault::blake3
