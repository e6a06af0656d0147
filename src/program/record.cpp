// VEIL - Records
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/program/record.h"
#include "veil/core/errors.h"
#include "veil/network/network.h"

namespace veil {

namespace {

void AppendBits(Bits& out, const Bits& in) {
    out.insert(out.end(), in.begin(), in.end());
}

void AppendSized(Bits& out, const Bits& in) {
    if (in.size() > 0xFFFF) {
        throw Error("Record entry exceeds the encodable size");
    }
    AppendBitsLE(out, in.size(), 16);
    AppendBits(out, in);
}

/// Hand out consecutive slices of a randomizer stream
class RandomizerCursor {
public:
    explicit RandomizerCursor(std::vector<Field> randomizers) : randomizers_(std::move(randomizers)) {}

    std::vector<Field> Take(size_t n) {
        if (pos_ + n > randomizers_.size()) {
            throw Error("Record randomizer stream exhausted");
        }
        std::vector<Field> out(randomizers_.begin() + pos_, randomizers_.begin() + pos_ + n);
        pos_ += n;
        return out;
    }

private:
    std::vector<Field> randomizers_;
    size_t pos_{0};
};

Ciphertext AddRandomizers(const std::vector<Field>& fields, const std::vector<Field>& randomizers) {
    std::vector<Field> out(fields.size());
    for (size_t i = 0; i < fields.size(); ++i) {
        out[i] = fields[i] + randomizers[i];
    }
    return Ciphertext(std::move(out));
}

} // namespace

// ============================================================================
// Record
// ============================================================================

Record::Record(const Address& owner, Visibility ownerMode, Gates gates, Visibility gatesMode,
               Entries entries, const Point& nonce)
    : owner_(owner)
    , ownerMode_(ownerMode)
    , gates_(gates)
    , gatesMode_(gatesMode)
    , data_(std::move(entries))
    , nonce_(nonce) {
    if (ownerMode == Visibility::Constant || gatesMode == Visibility::Constant) {
        throw Error("Record owner and gates must be public or private");
    }
    if (data_.size() > 0xFF) {
        throw Error("Record has too many entries");
    }
}

Bits Record::ToBitsLE() const {
    Bits bits;
    bits.push_back(ownerMode_ == Visibility::Private);
    AppendBits(bits, owner_.ToGroup().ToBitsLE());
    bits.push_back(gatesMode_ == Visibility::Private);
    AppendBitsLE(bits, gates_, 64);
    AppendBitsLE(bits, data_.size(), 8);
    for (const auto& e : data_) {
        AppendBits(bits, e.first.ToBitsLE());
        AppendBitsLE(bits, static_cast<uint8_t>(e.second.mode), 2);
        AppendSized(bits, e.second.value.ToBitsLE());
    }
    AppendBits(bits, nonce_.ToBitsLE());
    return bits;
}

Field Record::ToCommitment(const ProgramID& programID, const Identifier& recordName) const {
    Bits preimage = programID.ToBitsLE();
    AppendBits(preimage, recordName.ToBitsLE());
    AppendBits(preimage, ToBitsLE());
    return network::HashBHP1024(preimage);
}

RecordCiphertext Record::Encrypt(const Scalar& randomizer) const {
    if (network::GScalarMultiply(randomizer) != nonce_) {
        throw CheckError("Record nonce does not match the encryption randomizer");
    }

    // Plaintext fields of every private component, in encoding order
    std::vector<std::vector<Field>> privateFields;
    if (ownerMode_ == Visibility::Private) {
        privateFields.push_back(Plaintext(Literal::FromAddress(owner_)).ToFields());
    }
    if (gatesMode_ == Visibility::Private) {
        privateFields.push_back(Plaintext(Literal::FromU64(gates_)).ToFields());
    }
    for (const auto& e : data_) {
        if (e.second.mode == Visibility::Private) {
            privateFields.push_back(e.second.value.ToFields());
        }
    }
    size_t total = 0;
    for (const auto& f : privateFields) total += f.size();

    Field recordViewKey = (owner_.ToGroup() * randomizer).ToXField();
    RandomizerCursor cursor(SymmetricRandomizers(recordViewKey, total));
    auto next = privateFields.begin();

    RecordCiphertext out;
    out.ownerMode_ = ownerMode_;
    if (ownerMode_ == Visibility::Private) {
        out.ownerCiphertext_ = AddRandomizers(*next, cursor.Take(next->size()));
        ++next;
    } else {
        out.ownerPublic_ = owner_;
    }
    out.gatesMode_ = gatesMode_;
    if (gatesMode_ == Visibility::Private) {
        out.gatesCiphertext_ = AddRandomizers(*next, cursor.Take(next->size()));
        ++next;
    } else {
        out.gatesPublic_ = gates_;
    }
    for (const auto& e : data_) {
        RecordCiphertext::Entry entry;
        entry.mode = e.second.mode;
        if (e.second.mode == Visibility::Private) {
            entry.ciphertext = AddRandomizers(*next, cursor.Take(next->size()));
            ++next;
        } else {
            entry.plaintext = e.second.value;
        }
        out.data_.emplace_back(e.first, std::move(entry));
    }
    out.nonce_ = nonce_;
    return out;
}

Field Record::SerialNumberFromGamma(const Point& gamma, const Field& commitment) {
    const Field& domain = network::SerialNumberDomain();
    Bits preimage = domain.ToBitsLE();
    AppendBits(preimage, commitment.ToBitsLE());
    Scalar randomizer = network::HashToScalarPSD2({domain, gamma.ToXField()});
    return network::CommitBHP1024(preimage, randomizer);
}

Field Record::Tag(const Field& skTag, const Field& commitment) {
    return network::HashPSD2({skTag, commitment});
}

bool Record::operator==(const Record& other) const {
    return owner_ == other.owner_ && ownerMode_ == other.ownerMode_ && gates_ == other.gates_ &&
           gatesMode_ == other.gatesMode_ && data_ == other.data_ && nonce_ == other.nonce_;
}

// ============================================================================
// RecordCiphertext
// ============================================================================

size_t RecordCiphertext::PrivateFieldCount() const {
    size_t n = 0;
    if (ownerMode_ == Visibility::Private) n += ownerCiphertext_.Size();
    if (gatesMode_ == Visibility::Private) n += gatesCiphertext_.Size();
    for (const auto& e : data_) {
        if (e.second.mode == Visibility::Private) n += e.second.ciphertext.Size();
    }
    return n;
}

Record RecordCiphertext::Decrypt(const ViewKey& viewKey) const {
    Field recordViewKey = (nonce_ * viewKey.ToScalar()).ToXField();
    RandomizerCursor cursor(SymmetricRandomizers(recordViewKey, PrivateFieldCount()));

    Address owner = ownerPublic_;
    if (ownerMode_ == Visibility::Private) {
        owner = ownerCiphertext_.Decrypt(cursor.Take(ownerCiphertext_.Size())).GetLiteral().AsAddress();
    }
    Gates gates = gatesPublic_;
    if (gatesMode_ == Visibility::Private) {
        gates = gatesCiphertext_.Decrypt(cursor.Take(gatesCiphertext_.Size())).GetLiteral().AsU64();
    }
    Record::Entries entries;
    for (const auto& e : data_) {
        Record::Entry entry;
        entry.mode = e.second.mode;
        if (e.second.mode == Visibility::Private) {
            entry.value = e.second.ciphertext.Decrypt(cursor.Take(e.second.ciphertext.Size()));
        } else {
            entry.value = e.second.plaintext;
        }
        entries.emplace_back(e.first, std::move(entry));
    }
    return Record(owner, ownerMode_, gates, gatesMode_, std::move(entries), nonce_);
}

bool RecordCiphertext::IsOwner(const ViewKey& viewKey) const {
    Address candidate = viewKey.ToAddress();
    if (ownerMode_ != Visibility::Private) {
        return ownerPublic_ == candidate;
    }
    // The owner is the first private component
    Field recordViewKey = (nonce_ * viewKey.ToScalar()).ToXField();
    auto randomizers = SymmetricRandomizers(recordViewKey, ownerCiphertext_.Size());
    try {
        return ownerCiphertext_.Decrypt(randomizers).GetLiteral().AsAddress() == candidate;
    } catch (const DecodeError&) {
        return false;
    } catch (const ValueKindError&) {
        return false;
    }
}

Bits RecordCiphertext::ToBitsLE() const {
    Bits bits;
    bits.push_back(ownerMode_ == Visibility::Private);
    if (ownerMode_ == Visibility::Private) {
        AppendBits(bits, ownerCiphertext_.ToBitsLE());
    } else {
        AppendBits(bits, ownerPublic_.ToGroup().ToBitsLE());
    }
    bits.push_back(gatesMode_ == Visibility::Private);
    if (gatesMode_ == Visibility::Private) {
        AppendBits(bits, gatesCiphertext_.ToBitsLE());
    } else {
        AppendBitsLE(bits, gatesPublic_, 64);
    }
    AppendBitsLE(bits, data_.size(), 8);
    for (const auto& e : data_) {
        AppendBits(bits, e.first.ToBitsLE());
        AppendBitsLE(bits, static_cast<uint8_t>(e.second.mode), 2);
        if (e.second.mode == Visibility::Private) {
            AppendBits(bits, e.second.ciphertext.ToBitsLE());
        } else {
            AppendSized(bits, e.second.plaintext.ToBitsLE());
        }
    }
    AppendBits(bits, nonce_.ToBitsLE());
    return bits;
}

bool RecordCiphertext::operator==(const RecordCiphertext& other) const {
    return ownerMode_ == other.ownerMode_ && ownerPublic_ == other.ownerPublic_ &&
           ownerCiphertext_ == other.ownerCiphertext_ && gatesMode_ == other.gatesMode_ &&
           gatesPublic_ == other.gatesPublic_ && gatesCiphertext_ == other.gatesCiphertext_ &&
           data_ == other.data_ && nonce_ == other.nonce_;
}

} // namespace veil
