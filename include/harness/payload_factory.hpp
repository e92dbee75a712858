#pragma once

#include "network/message.hpp"
#include <cstddef>
#include <functional>
#include <vector>

namespace algoprobe {
namespace harness {

/**
 * PayloadFactory - produces a stream of payloads from one template
 *
 * generate_next() runs the customizer on the template, then returns a copy,
 * so every generated payload reflects all customizations so far. The default
 * customizer increments the nonce of UE and UC requests and leaves every
 * other payload unchanged.
 */
class PayloadFactory {
public:
  using Customizer = std::function<void(message::Payload &)>;

  explicit PayloadFactory(const message::Payload &payload, Customizer customizer = nullptr);

  PayloadFactory(const PayloadFactory &other);
  PayloadFactory &operator=(const PayloadFactory &other);
  PayloadFactory(PayloadFactory &&) = default;
  PayloadFactory &operator=(PayloadFactory &&) = default;

  message::PayloadPtr generate_next();
  std::vector<message::PayloadPtr> generate_payloads(size_t count);

  // Replace the cache with count freshly generated payloads
  void pre_generate_payloads_cache(size_t count);
  const std::vector<message::PayloadPtr> &get_pre_generated_payload_cache() const {
    return cache_;
  }

  const message::Payload &current() const { return *template_; }

  static void IncrementRequestNonce(message::Payload &payload);

private:
  message::PayloadPtr template_;
  Customizer customizer_;
  std::vector<message::PayloadPtr> cache_;
};

} // namespace harness
} // namespace algoprobe
