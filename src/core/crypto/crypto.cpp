#include "core/crypto/crypto.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_map>

#include <sodium.h>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace gambit {
namespace {

constexpr std::string_view kVaultFileName = "identity.vault";
constexpr std::string_view kVaultFormat = "gambit-vault-v1";

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return {};
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool write_file(const std::filesystem::path& path, std::string_view data) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }

  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  return static_cast<bool>(out);
}

const unsigned char* bytes_of(std::string_view text) {
  return reinterpret_cast<const unsigned char*>(text.data());
}

bool derive_argon2id_key(std::string_view passphrase,
                         const std::array<unsigned char, crypto_pwhash_SALTBYTES>& salt,
                         std::array<unsigned char, crypto_secretbox_KEYBYTES>& out_key) {
  return crypto_pwhash(out_key.data(), out_key.size(), passphrase.data(),
                       static_cast<unsigned long long>(passphrase.size()), salt.data(),
                       crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE,
                       crypto_pwhash_ALG_ARGON2ID13) == 0;
}

IdentityKeyPair parse_identity(std::string_view plain) {
  const auto values = util::parse_canonical_map(plain);
  IdentityKeyPair key_pair;
  if (values.contains("public_key")) {
    key_pair.public_key = values.at("public_key");
  }
  if (values.contains("private_key")) {
    key_pair.private_key = values.at("private_key");
  }
  return key_pair;
}

bool to_curve_keys(const IdentityKeyPair& own, std::string_view peer_public_key,
                   std::array<unsigned char, crypto_box_SECRETKEYBYTES>& own_secret,
                   std::array<unsigned char, crypto_box_PUBLICKEYBYTES>& peer_public) {
  const std::string own_sk = util::from_hex(own.private_key);
  const std::string peer_pk = util::from_hex(peer_public_key);
  if (own_sk.size() != crypto_sign_SECRETKEYBYTES || peer_pk.size() != crypto_sign_PUBLICKEYBYTES) {
    return false;
  }
  if (crypto_sign_ed25519_sk_to_curve25519(own_secret.data(), bytes_of(own_sk)) != 0) {
    return false;
  }
  return crypto_sign_ed25519_pk_to_curve25519(peer_public.data(), bytes_of(peer_pk)) == 0;
}

}  // namespace

Result CryptoEngine::initialize(std::string_view app_data_dir, std::string_view passphrase) {
  app_data_dir_ = std::string{app_data_dir};
  ready_ = false;

  if (passphrase.empty()) {
    return Result::failure(ErrorCode::InvalidInput,
                           "Passphrase is required to unlock the local identity vault.");
  }
  if (!util::ensure_sodium()) {
    return Result::failure(ErrorCode::Crypto, "libsodium initialization failed.");
  }

  std::error_code ec;
  const std::filesystem::path root{app_data_dir_};
  std::filesystem::create_directories(root, ec);
  if (ec) {
    return Result::failure(ErrorCode::Storage, "Failed to create app data directory: " + ec.message());
  }

  if (std::filesystem::exists(root / std::string{kVaultFileName})) {
    return unlock_from_vault(passphrase);
  }

  identity_ = generate_keypair();
  const Result persist_result = persist_identity_vault(passphrase);
  if (!persist_result.ok) {
    return persist_result;
  }

  ready_ = true;
  return Result::success("Identity vault created.", identity_.public_key);
}

Result CryptoEngine::unlock_from_vault(std::string_view passphrase) {
  const std::string vault_text = read_file(vault_path());
  if (vault_text.empty()) {
    return Result::failure(ErrorCode::Storage, "Identity vault exists but is empty.");
  }

  const auto values = util::parse_canonical_map(vault_text);
  if (!values.contains("format") || values.at("format") != kVaultFormat || !values.contains("salt") ||
      !values.contains("nonce") || !values.contains("cipher")) {
    return Result::failure(ErrorCode::Storage, "Identity vault format is invalid.");
  }

  const std::string salt_bytes = util::from_hex(values.at("salt"));
  const std::string nonce = util::from_hex(values.at("nonce"));
  const std::string cipher = util::from_hex(values.at("cipher"));
  if (salt_bytes.size() != crypto_pwhash_SALTBYTES || nonce.size() != crypto_secretbox_NONCEBYTES ||
      cipher.size() < crypto_secretbox_MACBYTES) {
    return Result::failure(ErrorCode::Storage, "Identity vault format is invalid.");
  }

  std::array<unsigned char, crypto_pwhash_SALTBYTES> salt{};
  std::copy(salt_bytes.begin(), salt_bytes.end(), salt.begin());

  std::array<unsigned char, crypto_secretbox_KEYBYTES> key{};
  if (!derive_argon2id_key(passphrase, salt, key)) {
    return Result::failure(ErrorCode::Crypto, "Failed to derive vault key (Argon2id).");
  }

  std::string plain(cipher.size() - crypto_secretbox_MACBYTES, '\0');
  if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(plain.data()), bytes_of(cipher),
                                 static_cast<unsigned long long>(cipher.size()), bytes_of(nonce),
                                 key.data()) != 0) {
    return Result::failure(ErrorCode::Crypto,
                           "Identity vault could not be decrypted. Wrong passphrase or corrupt file.");
  }

  identity_ = parse_identity(plain);
  sodium_memzero(plain.data(), plain.size());
  if (!util::is_hex_of_size(identity_.public_key, crypto_sign_PUBLICKEYBYTES) ||
      !util::is_hex_of_size(identity_.private_key, crypto_sign_SECRETKEYBYTES)) {
    return Result::failure(ErrorCode::Storage, "Identity vault payload could not be parsed.");
  }

  ready_ = true;
  return Result::success("Identity vault unlocked.", identity_.public_key);
}

Result CryptoEngine::persist_identity_vault(std::string_view passphrase) {
  std::array<unsigned char, crypto_pwhash_SALTBYTES> salt{};
  randombytes_buf(salt.data(), salt.size());

  std::array<unsigned char, crypto_secretbox_KEYBYTES> key{};
  if (!derive_argon2id_key(passphrase, salt, key)) {
    return Result::failure(ErrorCode::Crypto, "Failed to derive vault key (Argon2id).");
  }

  std::array<unsigned char, crypto_secretbox_NONCEBYTES> nonce{};
  randombytes_buf(nonce.data(), nonce.size());

  const std::string plain = util::canonical_join({
      {"public_key", identity_.public_key},
      {"private_key", identity_.private_key},
  });
  std::string cipher(plain.size() + crypto_secretbox_MACBYTES, '\0');
  crypto_secretbox_easy(reinterpret_cast<unsigned char*>(cipher.data()), bytes_of(plain),
                        static_cast<unsigned long long>(plain.size()), nonce.data(), key.data());

  const std::string vault_text = util::canonical_join({
      {"format", std::string{kVaultFormat}},
      {"salt", util::to_hex(std::string_view{reinterpret_cast<const char*>(salt.data()), salt.size()})},
      {"nonce", util::to_hex(std::string_view{reinterpret_cast<const char*>(nonce.data()), nonce.size()})},
      {"cipher", util::to_hex(cipher)},
  });

  if (!write_file(vault_path(), vault_text)) {
    return Result::failure(ErrorCode::Storage, "Failed to write identity vault.");
  }
  return Result::success("Identity vault written.");
}

std::string CryptoEngine::vault_path() const {
  if (app_data_dir_.empty()) {
    return {};
  }
  return (std::filesystem::path{app_data_dir_} / std::string{kVaultFileName}).string();
}

IdentityKeyPair CryptoEngine::generate_keypair() {
  util::ensure_sodium();
  std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> pk{};
  std::array<unsigned char, crypto_sign_SECRETKEYBYTES> sk{};
  crypto_sign_keypair(pk.data(), sk.data());

  IdentityKeyPair keys;
  keys.public_key = util::to_hex(std::string_view{reinterpret_cast<const char*>(pk.data()), pk.size()});
  keys.private_key = util::to_hex(std::string_view{reinterpret_cast<const char*>(sk.data()), sk.size()});
  sodium_memzero(sk.data(), sk.size());
  return keys;
}

std::string CryptoEngine::sign_with(const IdentityKeyPair& keys, std::string_view payload) {
  const std::string private_key = util::from_hex(keys.private_key);
  if (private_key.size() != crypto_sign_SECRETKEYBYTES) {
    return {};
  }

  std::array<unsigned char, crypto_sign_BYTES> signature{};
  crypto_sign_detached(signature.data(), nullptr, bytes_of(payload),
                       static_cast<unsigned long long>(payload.size()), bytes_of(private_key));
  return util::to_hex(std::string_view{reinterpret_cast<const char*>(signature.data()), signature.size()});
}

bool CryptoEngine::verify(std::string_view payload, std::string_view signature, std::string_view public_key) {
  const std::string sig_bytes = util::from_hex(signature);
  const std::string public_key_bytes = util::from_hex(public_key);
  if (sig_bytes.size() != crypto_sign_BYTES || public_key_bytes.size() != crypto_sign_PUBLICKEYBYTES) {
    return false;
  }

  util::ensure_sodium();
  return crypto_sign_verify_detached(bytes_of(sig_bytes), bytes_of(payload),
                                     static_cast<unsigned long long>(payload.size()),
                                     bytes_of(public_key_bytes)) == 0;
}

Result CryptoEngine::encrypt_with(const IdentityKeyPair& sender, std::string_view recipient_public_key,
                                  std::string_view plaintext) {
  util::ensure_sodium();
  std::array<unsigned char, crypto_box_SECRETKEYBYTES> own_secret{};
  std::array<unsigned char, crypto_box_PUBLICKEYBYTES> peer_public{};
  if (!to_curve_keys(sender, recipient_public_key, own_secret, peer_public)) {
    return Result::failure(ErrorCode::Crypto, "Encryption failed: invalid key material.");
  }

  std::array<unsigned char, crypto_box_NONCEBYTES> nonce{};
  randombytes_buf(nonce.data(), nonce.size());

  std::string cipher(plaintext.size() + crypto_box_MACBYTES, '\0');
  const int rc = crypto_box_easy(reinterpret_cast<unsigned char*>(cipher.data()), bytes_of(plaintext),
                                 static_cast<unsigned long long>(plaintext.size()), nonce.data(),
                                 peer_public.data(), own_secret.data());
  sodium_memzero(own_secret.data(), own_secret.size());
  if (rc != 0) {
    return Result::failure(ErrorCode::Crypto, "Encryption failed.");
  }

  std::string framed{reinterpret_cast<const char*>(nonce.data()), nonce.size()};
  framed += cipher;
  return Result::success("Encrypted.", util::to_hex(framed));
}

Result CryptoEngine::decrypt_with(const IdentityKeyPair& recipient, std::string_view sender_public_key,
                                  std::string_view payload_hex) {
  util::ensure_sodium();
  const std::string framed = util::from_hex(payload_hex);
  if (framed.size() < crypto_box_NONCEBYTES + crypto_box_MACBYTES) {
    return Result::failure(ErrorCode::Crypto, "Decryption failed: payload too short.");
  }

  std::array<unsigned char, crypto_box_SECRETKEYBYTES> own_secret{};
  std::array<unsigned char, crypto_box_PUBLICKEYBYTES> peer_public{};
  if (!to_curve_keys(recipient, sender_public_key, own_secret, peer_public)) {
    return Result::failure(ErrorCode::Crypto, "Decryption failed: invalid key material.");
  }

  const std::string_view nonce{framed.data(), crypto_box_NONCEBYTES};
  const std::string_view cipher{framed.data() + crypto_box_NONCEBYTES,
                                framed.size() - crypto_box_NONCEBYTES};
  std::string plain(cipher.size() - crypto_box_MACBYTES, '\0');
  const int rc = crypto_box_open_easy(reinterpret_cast<unsigned char*>(plain.data()), bytes_of(cipher),
                                      static_cast<unsigned long long>(cipher.size()), bytes_of(nonce),
                                      peer_public.data(), own_secret.data());
  sodium_memzero(own_secret.data(), own_secret.size());
  if (rc != 0) {
    return Result::failure(ErrorCode::Crypto, "Decryption failed: authentication error.");
  }
  return Result::success("Decrypted.", std::move(plain));
}

}  // namespace gambit
