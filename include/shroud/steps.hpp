#pragma once
#include "shroud/pipeline.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace shroud {

std::unique_ptr<Step> make_encrypt_strings();
std::unique_ptr<Step> make_constant_array();
std::unique_ptr<Step> make_numbers_to_expressions();
std::unique_ptr<Step> make_proxify_locals();
std::unique_ptr<Step> make_anti_tamper();
std::unique_ptr<Step> make_wrap_in_function();

// EncryptStrings, ConstantArray, NumbersToExpressions, ProxifyLocals, AntiTamper, WrapInFunction.
void register_builtin_steps(StepRegistry& registry);

namespace cipher {
// Additive byte stream keyed by a 16-bit LCG; mirrors the decoder EncryptStrings splices in.
std::string encrypt(std::string_view plain, std::uint32_t seed);
std::string decrypt(std::string_view cipher, std::uint32_t seed);
// Base64 over a caller-chosen 64 character alphabet, '=' padded.
std::string base64(std::string_view bytes, std::string_view alphabet);
} // namespace cipher

} // namespace shroud
