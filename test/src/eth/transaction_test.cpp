#include "eth/transaction.hpp"
#include "eth/rlp.hpp"

#include <gtest/gtest.h>
#include "base/hexutil.hpp"
#include "crypto/keccak/keccak.hpp"
#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace chainrelay::eth;
using chainrelay::base::uint256_t;
using chainrelay::crypto::secp256k1::RecoverableSignature;

/**
 * Reference transaction from EIP-155: nonce 9, 20 gwei, 21000 gas, 1 ether
 * to 0x3535...35 on chain 1
 */
class LegacyTransactionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tx_.nonce = 9;
    tx_.gas_price = uint256_t("20000000000");
    tx_.gas_limit = 21000;
    tx_.to = "0x3535353535353535353535353535353535353535"_address;
    tx_.value = uint256_t("1000000000000000000");
    tx_.chain_id = 1;
  }

  LegacyTransaction tx_;
};

TEST_F(LegacyTransactionTest, SigningHashMatchesReference) {
  EXPECT_EQ(tx_.signingHash(),
            "daf5a779ae972f972197303d7b574746c7ef83eadac0f2791ad23db92e4c8e53"_hash256);
}

/**
 * @given the reference signature with recovery id 0
 * @when the signed transaction is encoded
 * @then v is 37 and the bytes match the reference raw transaction
 */
TEST_F(LegacyTransactionTest, SignedEncodingMatchesReference) {
  RecoverableSignature signature;
  signature.r = chainrelay::base::Blob<32>::fromHex(
                    "28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276")
                    .value();
  signature.s = chainrelay::base::Blob<32>::fromHex(
                    "67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83")
                    .value();
  signature.recovery_id = 0;

  auto raw = tx_.encodeSigned(signature);
  EXPECT_EQ(chainrelay::base::hex_lower(raw),
            "f86c098504a817c800825208943535353535353535353535353535353535353535"
            "880de0b6b3a76400008025a028ef61340bd939bc2195fe537567866003e1a15d3c"
            "71ff63e1590620aa636276a067cbe9d8997f761aecb703304b3800ccf555c9f3dc"
            "64214b297fb1966a3b6d83");
  EXPECT_EQ(transactionHash(raw), chainrelay::crypto::keccak256(raw));
}

/**
 * @given the reference key 0x4646...46
 * @when the provider signs the reference transaction
 * @then the raw transaction is byte for byte the reference one
 */
TEST_F(LegacyTransactionTest, SignedByProviderMatchesReference) {
  chainrelay::crypto::Secp256k1ProviderImpl provider;
  EXPECT_OUTCOME_TRUE(
      key,
      chainrelay::crypto::SecretKey::fromHex(
          "4646464646464646464646464646464646464646464646464646464646464646"));
  EXPECT_OUTCOME_TRUE(signature, provider.sign(tx_.signingHash(), key));
  EXPECT_EQ(signature.recovery_id, 0);

  EXPECT_EQ(chainrelay::base::hex_lower(tx_.encodeSigned(signature)),
            "f86c098504a817c800825208943535353535353535353535353535353535353535"
            "880de0b6b3a76400008025a028ef61340bd939bc2195fe537567866003e1a15d3c"
            "71ff63e1590620aa636276a067cbe9d8997f761aecb703304b3800ccf555c9f3dc"
            "64214b297fb1966a3b6d83");

  EXPECT_OUTCOME_TRUE(public_key, provider.derivePublicKey(key));
  EXPECT_OUTCOME_TRUE(recovered,
                      provider.recoverPublicKey(tx_.signingHash(), signature));
  EXPECT_EQ(recovered, public_key);
}

TEST_F(LegacyTransactionTest, ChainIdEntersSigningHash) {
  auto mainnet = tx_.signingHash();
  tx_.chain_id = 80001;
  EXPECT_NE(tx_.signingHash(), mainnet);
}
