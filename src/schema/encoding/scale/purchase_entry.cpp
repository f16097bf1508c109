#include <segurolluvia/schema/encoding/scale/purchase_entry.hpp>
#include <scale/scale.hpp>

namespace segurolluvia::schema {

void encode(const purchase_entry<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.mail, encoder);
  encode(o.bank_account, encoder);
  encode(o.place_address, encoder);
  encode(o.town, encoder);
  encode(o.province, encoder);
  encode(o.checkin_date, encoder);
  encode(o.checkout_date, encoder);
  encode(o.days, encoder);
  encode(o.rain_amount, encoder);
  encode(o.start_hour, encoder);
  encode(o.end_hour, encoder);
  encode(o.refund, encoder);
  encode(o.total, encoder);
}

void decode(purchase_entry<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.mail, decoder);
  decode(o.bank_account, decoder);
  decode(o.place_address, decoder);
  decode(o.town, decoder);
  decode(o.province, decoder);
  decode(o.checkin_date, decoder);
  decode(o.checkout_date, decoder);
  decode(o.days, decoder);
  decode(o.rain_amount, decoder);
  decode(o.start_hour, decoder);
  decode(o.end_hour, decoder);
  decode(o.refund, decoder);
  decode(o.total, decoder);
}

}  // namespace segurolluvia::schema
