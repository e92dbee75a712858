#include "harness/payload_factory.hpp"

namespace algoprobe {
namespace harness {

void PayloadFactory::IncrementRequestNonce(message::Payload &payload) {
  if (auto *req = dynamic_cast<message::BlockRequestPayload *>(&payload)) {
    ++req->request.nonce;
  }
}

PayloadFactory::PayloadFactory(const message::Payload &payload, Customizer customizer)
    : template_(payload.clone()),
      customizer_(customizer ? std::move(customizer) : Customizer(&IncrementRequestNonce)) {}

PayloadFactory::PayloadFactory(const PayloadFactory &other)
    : template_(other.template_->clone()), customizer_(other.customizer_) {
  cache_.reserve(other.cache_.size());
  for (const auto &p : other.cache_) {
    cache_.push_back(p->clone());
  }
}

PayloadFactory &PayloadFactory::operator=(const PayloadFactory &other) {
  if (this != &other) {
    PayloadFactory copy(other);
    *this = std::move(copy);
  }
  return *this;
}

message::PayloadPtr PayloadFactory::generate_next() {
  customizer_(*template_);
  return template_->clone();
}

std::vector<message::PayloadPtr> PayloadFactory::generate_payloads(size_t count) {
  std::vector<message::PayloadPtr> out;
  out.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    out.push_back(generate_next());
  }
  return out;
}

void PayloadFactory::pre_generate_payloads_cache(size_t count) {
  cache_ = generate_payloads(count);
}

} // namespace harness
} // namespace algoprobe
