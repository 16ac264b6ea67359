#include <libumbra/zkp/Note.h>
#include <libumbra/zkp/PoseidonHasher.h>

namespace umbra {
namespace zkp {

FieldT
computeCommitment(
    FieldT const& secret,
    FieldT const& nullifier,
    FieldT const& amount,
    FieldT const& recipientBinding)
{
    return PoseidonHasher::hash4(secret, nullifier, amount, recipientBinding);
}

FieldT
computeNullifierHash(FieldT const& nullifier, FieldT const& secret)
{
    return PoseidonHasher::hash2(nullifier, secret);
}

FieldT
Note::commitment() const
{
    return computeCommitment(secret, nullifier, amount, recipientBinding);
}

FieldT
Note::nullifierHash() const
{
    return computeNullifierHash(nullifier, secret);
}

Json::Value
Note::toJson() const
{
    Json::Value v(Json::objectValue);
    v["secret"] = fieldToHex(secret);
    v["nullifier"] = fieldToHex(nullifier);
    v["amount"] = fieldToHex(amount);
    v["recipientBinding"] = fieldToHex(recipientBinding);
    return v;
}

Note
Note::fromJson(Json::Value const& v)
{
    if (!v.isObject())
        throw InputValidationError("note must be a JSON object");

    auto field = [&v](char const* name) {
        if (!v.isMember(name) || v[name].isNull())
            throw MissingFieldError(name);
        if (!v[name].isString())
            throw InputValidationError(std::string(name) + " must be a hex string");
        return fieldFromHex(v[name].asString());
    };

    Note note;
    note.secret = field("secret");
    note.nullifier = field("nullifier");
    note.amount = field("amount");
    note.recipientBinding = field("recipientBinding");
    return note;
}

Note
Note::random(RandomSource& rng, FieldT const& amount, FieldT const& recipientBinding)
{
    Note note;
    note.secret = randomFieldElement(rng);
    note.nullifier = randomFieldElement(rng);
    note.amount = amount;
    note.recipientBinding = recipientBinding;
    return note;
}

NoteInputs::NoteInputs(Note const& note)
    : secret(note.secret)
    , nullifier(note.nullifier)
    , amount(note.amount)
    , recipientBinding(note.recipientBinding)
{
}

Note
NoteInputs::require() const
{
    if (!secret)
        throw MissingFieldError("secret");
    if (!nullifier)
        throw MissingFieldError("nullifier");
    if (!amount)
        throw MissingFieldError("amount");
    if (!recipientBinding)
        throw MissingFieldError("recipientBinding");
    return Note{*secret, *nullifier, *amount, *recipientBinding};
}

}  // namespace zkp
}  // namespace umbra
