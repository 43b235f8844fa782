#pragma once

#include <tollgate/schema/command.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared in the schema namespace so the codec finds them by ADL.
namespace tollgate::schema {

void encode(const command_t& o, ::scale::Encoder& encoder);
void decode(command_t& o, ::scale::Decoder& decoder);

}  // namespace tollgate::schema
