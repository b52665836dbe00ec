#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace gambit {

struct IdentityKeyPair {
  std::string public_key;   // 32-byte Ed25519 key, hex
  std::string private_key;  // 64-byte Ed25519 secret key, hex

  [[nodiscard]] bool empty() const { return public_key.empty() || private_key.empty(); }
};

class CryptoEngine {
public:
  Result initialize(std::string_view app_data_dir, std::string_view passphrase);

  [[nodiscard]] bool ready() const { return ready_; }
  [[nodiscard]] const IdentityKeyPair& identity() const { return identity_; }
  [[nodiscard]] std::string vault_path() const;

  static IdentityKeyPair generate_keypair();
  static std::string sign_with(const IdentityKeyPair& keys, std::string_view payload);
  static bool verify(std::string_view payload, std::string_view signature, std::string_view public_key);

  // X25519 box between two Ed25519 identities; output is hex(nonce || ciphertext).
  static Result encrypt_with(const IdentityKeyPair& sender, std::string_view recipient_public_key,
                             std::string_view plaintext);
  static Result decrypt_with(const IdentityKeyPair& recipient, std::string_view sender_public_key,
                             std::string_view payload_hex);

private:
  Result persist_identity_vault(std::string_view passphrase);
  Result unlock_from_vault(std::string_view passphrase);

  std::string app_data_dir_;
  IdentityKeyPair identity_;
  bool ready_ = false;
};

}  // namespace gambit
