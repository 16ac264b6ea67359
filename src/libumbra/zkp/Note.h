#pragma once

#include <libumbra/zkp/FieldElement.h>

#include <json/value.h>

#include <optional>

namespace umbra {
namespace zkp {

/**
 * A shielded note.
 *
 *   commitment     = Poseidon(secret, nullifier, amount, recipientBinding)
 *   nullifierHash  = Poseidon(nullifier, secret)
 *
 * The commitment is the tree leaf; the nullifier hash is the public
 * spend-once identifier. amount is bounded to 128 bits by the circuits.
 */
struct Note
{
    FieldT secret;
    FieldT nullifier;
    FieldT amount;
    FieldT recipientBinding;

    FieldT commitment() const;
    FieldT nullifierHash() const;

    /** Backup form: hex strings keyed by field name. */
    Json::Value toJson() const;

    /** Throws MissingFieldError for absent fields, InputValidationError for bad hex. */
    static Note fromJson(Json::Value const& v);

    /** Fresh secret and nullifier from rng. */
    static Note random(RandomSource& rng, FieldT const& amount, FieldT const& recipientBinding);
};

/** Note fields as they arrive from a request, each possibly absent. */
struct NoteInputs
{
    std::optional<FieldT> secret;
    std::optional<FieldT> nullifier;
    std::optional<FieldT> amount;
    std::optional<FieldT> recipientBinding;

    NoteInputs() = default;
    NoteInputs(Note const& note);

    /** Throws MissingFieldError naming the first absent field. */
    Note require() const;
};

FieldT computeCommitment(
    FieldT const& secret,
    FieldT const& nullifier,
    FieldT const& amount,
    FieldT const& recipientBinding);

FieldT computeNullifierHash(FieldT const& nullifier, FieldT const& secret);

}  // namespace zkp
}  // namespace umbra
