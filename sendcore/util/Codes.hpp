/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Result codes shared by every sendcore function.
 */

#ifndef SENDCORE_UTIL_CODES_HPP
#define SENDCORE_UTIL_CODES_HPP

/**
 * Error codes.
 * New values go at the end, since the numbers are persisted in logs.
 */
typedef enum eSC_CC
{
    /** The function completed without an error */
    SC_CC_Ok = 0,
    /** An error occured */
    SC_CC_Error,
    /** Invalid or missing JSON */
    SC_CC_JSONError,
    /** Unexpected end of data or malformed binary */
    SC_CC_ParseError,
    /** Error opening or reading a file */
    SC_CC_FileReadError,
    /** Error writing a file */
    SC_CC_FileWriteError,
    /** The file does not exist */
    SC_CC_FileDoesNotExist,
    /** The operating system refused a request */
    SC_CC_SysError,
    /** The object is not in a state that allows this call */
    SC_CC_InvalidState,

    /** The address contains a character outside its alphabet */
    SC_CC_AddressInvalidCharacter,
    /** The address is too long or too short */
    SC_CC_AddressInvalidLength,
    /** The address checksum does not match */
    SC_CC_AddressInvalidChecksum,
    /** A bech32 address mixes upper and lower case */
    SC_CC_AddressMixedCase,
    /** The address prefix matches no supported format */
    SC_CC_AddressUnknownFormat,

    /** The requested fee rate does not exceed the current one */
    SC_CC_FeeBumpNotHigherThanCurrent,
    /** The wallet cannot pay for the fee bump */
    SC_CC_FeeBumpInsufficientFunds,
    /** The fee rate is below the relay minimum */
    SC_CC_FeeRateBelowMinimum,

    /** The engine could not fund the transaction */
    SC_CC_DryRunInsufficientFunds,
    /** An output would be below the dust limit */
    SC_CC_DryRunBelowDustLimit,
    /** The engine has no backend connection */
    SC_CC_DryRunNetworkUnavailable,

    /** A commit is already running for this draft */
    SC_CC_CommitInFlight,
    /** The draft is not ready to commit */
    SC_CC_NotSendable,
    /** The coin is unknown, spent, or frozen */
    SC_CC_CoinNotSpendable,

    /** The signer's reply cannot be decoded */
    SC_CC_PsbtUnparseableSignedPayload,
    /** The signer's reply carries no signatures */
    SC_CC_PsbtNotSigned,
    /** The signer's reply spends different coins */
    SC_CC_PsbtPayloadMismatch,
    /** The signed transaction was not accepted by the network */
    SC_CC_PsbtBroadcastFailed
} tSC_CC;

#endif
