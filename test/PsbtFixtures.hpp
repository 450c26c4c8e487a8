/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SENDCORE_TEST_PSBT_FIXTURES_HPP
#define SENDCORE_TEST_PSBT_FIXTURES_HPP

namespace fixtures {

// An unsigned PSBT spending two 25000 sat coins, with 30000 to a
// recipient and 19000 to a change output the wallet can derive.
static const char unsignedPsbtBase64[] =
    "cHNidP8BAJoCAAAAAgECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8gAAAA"
    "AAD9////ISIjJCUmJygpKissLS4vMDEyMzQ1Njc4OTo7PD0+P0ABAAAAAP3///8C"
    "MHUAAAAAAAAWABQREREREREREREREREREREREREREThKAAAAAAAAFgAUIiIiIiIi"
    "IiIiIiIiIiIiIiIiIiIAAAAAAAEBH6hhAAAAAAAAFgAUMzMzMzMzMzMzMzMzMzMz"
    "MzMzMzMAAQEfqGEAAAAAAAAWABQzMzMzMzMzMzMzMzMzMzMzMzMzMwAAIgICRERE"
    "REREREREREREREREREREREREREREREREREREREQQ3q2+71QAAIABAAAABQAAAAA=";

static const char unsignedPsbtHex[] =
    "70736274ff01009a02000000020102030405060708090a0b0c0d0e0f10111213"
    "1415161718191a1b1c1d1e1f200000000000fdffffff2122232425262728292a"
    "2b2c2d2e2f303132333435363738393a3b3c3d3e3f400100000000fdffffff02"
    "3075000000000000160014111111111111111111111111111111111111111138"
    "4a00000000000016001422222222222222222222222222222222222222220000"
    "00000001011fa861000000000000160014333333333333333333333333333333"
    "33333333330001011fa861000000000000160014333333333333333333333333"
    "3333333333333333000022020244444444444444444444444444444444444444"
    "4444444444444444444444444410deadbeef54000080010000000500000000";

// The same PSBT with a partial signature on each input, where the
// signer kept only the first UTXO record and dropped the derivation.
static const char signedPsbtBase64[] =
    "cHNidP8BAJoCAAAAAgECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8gAAAA"
    "AAD9////ISIjJCUmJygpKissLS4vMDEyMzQ1Njc4OTo7PD0+P0ABAAAAAP3///8C"
    "MHUAAAAAAAAWABQREREREREREREREREREREREREREThKAAAAAAAAFgAUIiIiIiIi"
    "IiIiIiIiIiIiIiIiIiIAAAAAAAEBH6hhAAAAAAAAFgAUMzMzMzMzMzMzMzMzMzMz"
    "MzMzMzMiAgJEREREREREREREREREREREREREREREREREREREREREREgwVVVVVVVV"
    "VVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVV"
    "VVVVVVVVVVVVVVVVVVVVVQEAIgICRERERERERERERERERERERERERERERERERERE"
    "RERERERIMFVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVV"
    "VVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVUBAAAA";

// Both inputs finalized.
static const char finalPsbtBase64[] =
    "cHNidP8BAJoCAAAAAgECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8gAAAA"
    "AAD9////ISIjJCUmJygpKissLS4vMDEyMzQ1Njc4OTo7PD0+P0ABAAAAAP3///8C"
    "MHUAAAAAAAAWABQREREREREREREREREREREREREREThKAAAAAAAAFgAUIiIiIiIi"
    "IiIiIiIiIiIiIiIiIiIAAAAAAAEBH6hhAAAAAAAAFgAUMzMzMzMzMzMzMzMzMzMz"
    "MzMzMzMBCGwCSDBVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVV"
    "VVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVASECRERERERERERERERE"
    "REREREREREREREREREREREREREQAAQhsAkgwVVVVVVVVVVVVVVVVVVVVVVVVVVVV"
    "VVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVV"
    "VQEhAkREREREREREREREREREREREREREREREREREREREREREAAAiAgJERERERERE"
    "RERERERERERERERERERERERERERERERERBDerb7vVAAAgAEAAAAFAAAAAA==";

// A signed PSBT that spends some other coin.
static const char mismatchPsbtBase64[] =
    "cHNidP8BAHECAAAAAaqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqAAAA"
    "AAD9////AjB1AAAAAAAAFgAUERERERERERERERERERERERERERE4SgAAAAAAABYA"
    "FCIiIiIiIiIiIiIiIiIiIiIiIiIiAAAAAAABAR+oYQAAAAAAABYAFDMzMzMzMzMz"
    "MzMzMzMzMzMzMzMzIgICRERERERERERERERERERERERERERERERERERERERERERI"
    "MFVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVVV"
    "VVVVVVVVVVVVVVVVVVVVVVVVVVVVVVUBAAAA";

// The unsigned PSBT cut short in its last output map.
static const char truncatedPsbtBase64[] =
    "cHNidP8BAJoCAAAAAgECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8gAAAA"
    "AAD9////ISIjJCUmJygpKissLS4vMDEyMzQ1Njc4OTo7PD0+P0ABAAAAAP3///8C"
    "MHUAAAAAAAAWABQREREREREREREREREREREREREREThKAAAAAAAAFgAUIiIiIiIi"
    "IiIiIiIiIiIiIiIiIiIAAAAAAAEBH6hhAAAAAAAAFgAUMzMzMzMzMzMzMzMzMzMz"
    "MzMzMzMAAQEfqGEAAAAAAAAWABQzMzMzMzMzMzMzMzMzMzMzMzMzMwAAIgICRERE"
    "REREREREREREREREREREREREREREREREREREREQQ3q2+71QAAA==";

// The unsigned PSBT, signed and extracted.
static const char segwitTxHex[] =
    "020000000001020102030405060708090a0b0c0d0e0f10111213141516171819"
    "1a1b1c1d1e1f200000000000fdffffff2122232425262728292a2b2c2d2e2f30"
    "3132333435363738393a3b3c3d3e3f400100000000fdffffff02307500000000"
    "00001600141111111111111111111111111111111111111111384a0000000000"
    "0016001422222222222222222222222222222222222222220248305555555555"
    "5555555555555555555555555555555555555555555555555555555555555555"
    "5555555555555555555555555555555555555555555555555555555555555555"
    "5501210244444444444444444444444444444444444444444444444444444444"
    "4444444402483055555555555555555555555555555555555555555555555555"
    "5555555555555555555555555555555555555555555555555555555555555555"
    "5555555555555555555555555501210244444444444444444444444444444444"
    "4444444444444444444444444444444400000000";

// A legacy transaction spending the first coin.
static const char legacyTxHex[] =
    "02000000010102030405060708090a0b0c0d0e0f101112131415161718191a1b"
    "1c1d1e1f20000000006b47305555555555555555555555555555555555555555"
    "5555555555555555555555555555555555555555555555555555555555555555"
    "5555555555555555555555555555555555550121024444444444444444444444"
    "444444444444444444444444444444444444444444fdffffff01393000000000"
    "0000160014111111111111111111111111111111111111111100000000";

static const char unsignedTxid[] =
    "021686d9f462a727113e173b7e917090b3cfe7a87d3b1ed893ad8821cc36459a";
static const char legacyTxid[] =
    "a658c2a6149179e0043fac8f489cda8df500de90d2a23f41c057db83390813bf";

static const char outpoint0[] =
    "201f1e1d1c1b1a191817161514131211100f0e0d0c0b0a090807060504030201"
    ":0";
static const char outpoint1[] =
    "403f3e3d3c3b3a393837363534333231302f2e2d2c2b2a292827262524232221"
    ":1";

static const char recipientScript[] =
    "00141111111111111111111111111111111111111111";

} // namespace fixtures

#endif
