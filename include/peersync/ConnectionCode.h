/**
 * @file ConnectionCode.h
 * @brief Short connection codes and the endpoint ids derived from them.
 *
 * The sender shows a 6-character code; the receiver types it in. The code
 * is also the rendezvous key: the sender registers its endpoint under
 * "nbp-sync-<CODE>" and the receiver dials that id.
 */

#pragma once

#include <string>

namespace PeerSync {

class ConnectionCode {
public:
    /**
     * @brief Generate a fresh code from the 32-symbol alphabet.
     *
     * @param outCode Output code (6 uppercase characters).
     * @param errorMsg Output error on failure.
     * @return true on success.
     */
    static bool generate(std::string& outCode, std::string& errorMsg);

    /**
     * @brief Normalize a user-entered code.
     *
     * Uppercases, strips every character outside [A-Z0-9] (spaces, dashes,
     * punctuation), and requires exactly 6 characters to remain.
     *
     * Characters outside the generation alphabet (0, O, 1, I) are kept:
     * the sender rejects unknown ids, so a mistyped code fails at dial time.
     *
     * @param input Raw user input.
     * @param outCode Output normalized code.
     * @param errorMsg Output error on failure.
     * @return true if the input normalizes to a 6-character code.
     */
    static bool normalize(const std::string& input, std::string& outCode, std::string& errorMsg);

    /// true if `code` is already in normalized form
    static bool isNormalized(const std::string& code);

    /// true if every character of `code` is in the generation alphabet
    static bool isFromAlphabet(const std::string& code);

    /// Sender endpoint id for a normalized code ("nbp-sync-<CODE>")
    static std::string senderEndpointId(const std::string& code);

    /**
     * @brief Build a receiver endpoint id ("nbp-recv-<random code>-<base36 ms>").
     *
     * The timestamp suffix keeps ids unique across reconnects from the same
     * device.
     */
    static bool receiverEndpointId(std::string& outId, std::string& errorMsg);
};

}  // namespace PeerSync
