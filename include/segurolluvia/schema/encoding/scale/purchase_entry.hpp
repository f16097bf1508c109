#pragma once
#include <segurolluvia/schema/purchase_entry.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared next to the schema type so the SCALE container codecs reach them
// through argument dependent lookup.
namespace segurolluvia::schema {

void encode(const purchase_entry<1>& o, ::scale::Encoder& encoder);
void decode(purchase_entry<1>& o, ::scale::Decoder& decoder);

}  // namespace segurolluvia::schema
