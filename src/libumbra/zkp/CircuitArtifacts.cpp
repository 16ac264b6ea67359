#include <libumbra/zkp/CircuitArtifacts.h>
#include <libumbra/zkp/circuits/PoolCircuit.h>

#include <json/reader.h>
#include <json/writer.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>

namespace umbra {
namespace zkp {

namespace fs = std::filesystem;

namespace {

Json::Value
readJsonFile(std::string const& path)
{
    std::ifstream in(path);
    if (!in.good())
        throw CircuitLoadError("cannot open " + path);

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors))
        throw CircuitLoadError("invalid JSON in " + path + ": " + errors);
    return root;
}

// Writes to a sibling temporary file and renames it into place, so a
// crash never leaves a truncated artifact behind.
void
writeFile(std::string const& path, std::function<void(std::ostream&)> const& body)
{
    fs::path const target(path);
    if (target.has_parent_path())
    {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec)
            throw CircuitLoadError(
                "cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    std::string const tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good())
            throw CircuitLoadError("cannot write " + tmp);
        body(out);
        out.flush();
        if (!out)
            throw CircuitLoadError("write to " + tmp + " failed");
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec)
        throw CircuitLoadError("cannot move " + tmp + " into place: " + ec.message());
}

void
writeJsonFile(std::string const& path, Json::Value const& v)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    writeFile(path, [&](std::ostream& out) { out << Json::writeString(builder, v) << '\n'; });
}

std::size_t
requireCount(Json::Value const& v, char const* field)
{
    if (!v.isMember(field))
        throw CircuitLoadError(std::string("circuit descriptor is missing ") + field);
    if (!v[field].isUInt64())
        throw CircuitLoadError(std::string("circuit descriptor field ") + field +
                               " must be a non-negative integer");
    return static_cast<std::size_t>(v[field].asUInt64());
}

VerifyingKey
verifyingKeyFromKeypair(libsnark::r1cs_gg_ppzksnark_keypair<DefaultCurve> const& keypair)
{
    VerifyingKey vk;
    vk.alpha = keypair.pk.alpha_g1;
    vk.beta = keypair.pk.beta_g2;
    vk.gamma = keypair.vk.gamma_g2;
    vk.delta = keypair.vk.delta_g2;

    auto const& acc = keypair.vk.gamma_ABC_g1;
    vk.ic.push_back(acc.first);
    std::vector<G1T> rest(acc.rest.domain_size(), G1T::zero());
    for (std::size_t k = 0; k < acc.rest.indices.size(); ++k)
        rest[acc.rest.indices[k]] = acc.rest.values[k];
    vk.ic.insert(vk.ic.end(), rest.begin(), rest.end());
    return vk;
}

}  // namespace

CircuitArtifactPaths
CircuitArtifactPaths::inDirectory(std::string const& directory, CircuitId id)
{
    fs::path const dir(directory);
    std::string const name = to_string(id);

    CircuitArtifactPaths paths;
    paths.constraintSystem = (dir / (name + ".r1cs")).string();
    paths.witnessProgram = (dir / (name + ".circuit.json")).string();
    paths.provingKey = (dir / (name + ".pk")).string();
    paths.verifyingKey = (dir / (name + "_verification_key.json")).string();
    return paths;
}

//------------------------------------------------------------------------------

Json::Value
CircuitDescriptor::toJson() const
{
    Json::Value v(Json::objectValue);
    v["circuit"] = to_string(id);
    v["treeDepth"] = Json::UInt64(treeDepth);
    v["nPublic"] = Json::UInt64(numPublicInputs);
    v["nConstraints"] = Json::UInt64(numConstraints);
    v["nVariables"] = Json::UInt64(numVariables);
    return v;
}

CircuitDescriptor
CircuitDescriptor::fromJson(Json::Value const& v)
{
    if (!v.isObject())
        throw CircuitLoadError("circuit descriptor must be a JSON object");
    if (!v["circuit"].isString())
        throw CircuitLoadError("circuit descriptor is missing circuit");

    auto const id = parseCircuitId(v["circuit"].asString());
    if (!id)
        throw CircuitLoadError("unknown circuit " + v["circuit"].asString());

    CircuitDescriptor d;
    d.id = *id;
    d.treeDepth = requireCount(v, "treeDepth");
    d.numPublicInputs = requireCount(v, "nPublic");
    d.numConstraints = requireCount(v, "nConstraints");
    d.numVariables = requireCount(v, "nVariables");
    return d;
}

//------------------------------------------------------------------------------

libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>
VerifyingKey::toSnark() const
{
    if (ic.empty())
        throw CircuitLoadError("verifying key has an empty IC vector");

    std::vector<G1T> rest(ic.begin() + 1, ic.end());
    libsnark::accumulation_vector<G1T> acc(
        G1T(ic.front()), libsnark::sparse_vector<G1T>(std::move(rest)));

    return libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>(
        DefaultCurve::reduced_pairing(alpha, beta), gamma, delta, acc);
}

Json::Value
VerifyingKey::toJson() const
{
    Json::Value v(Json::objectValue);
    v["protocol"] = "groth16";
    v["curve"] = "bn128";
    v["nPublic"] = Json::UInt64(ic.empty() ? 0 : ic.size() - 1);
    v["vk_alpha_1"] = g1ToJson(alpha);
    v["vk_beta_2"] = g2ToJson(beta);
    v["vk_gamma_2"] = g2ToJson(gamma);
    v["vk_delta_2"] = g2ToJson(delta);
    Json::Value& points = v["IC"] = Json::Value(Json::arrayValue);
    for (auto const& p : ic)
        points.append(g1ToJson(p));
    return v;
}

VerifyingKey
VerifyingKey::fromJson(Json::Value const& v)
{
    if (!v.isObject())
        throw CircuitLoadError("verifying key must be a JSON object");
    if (v["protocol"].asString() != "groth16")
        throw CircuitLoadError("verifying key protocol is not groth16");
    if (v["curve"].asString() != "bn128")
        throw CircuitLoadError("verifying key curve is not bn128");
    for (char const* field : {"vk_alpha_1", "vk_beta_2", "vk_gamma_2", "vk_delta_2", "IC"})
        if (!v.isMember(field))
            throw CircuitLoadError(std::string("verifying key is missing ") + field);
    if (!v["IC"].isArray() || v["IC"].empty())
        throw CircuitLoadError("verifying key IC must be a non-empty array");

    VerifyingKey vk;
    try
    {
        vk.alpha = g1FromJson(v["vk_alpha_1"]);
        vk.beta = g2FromJson(v["vk_beta_2"]);
        vk.gamma = g2FromJson(v["vk_gamma_2"]);
        vk.delta = g2FromJson(v["vk_delta_2"]);
        for (auto const& p : v["IC"])
            vk.ic.push_back(g1FromJson(p));
    }
    catch (MalformedProofError const& e)
    {
        throw CircuitLoadError(std::string("verifying key: ") + e.what());
    }

    if (v.isMember("nPublic") && v["nPublic"].isUInt64() &&
        v["nPublic"].asUInt64() + 1 != vk.ic.size())
        throw CircuitLoadError("verifying key nPublic does not match IC length");
    return vk;
}

//------------------------------------------------------------------------------

std::shared_ptr<LoadedCircuit const>
loadCircuitArtifacts(CircuitId id, CircuitArtifactPaths const& paths, Journal j)
{
    std::string const name = to_string(id);

    std::string missing;
    for (auto const& [label, path] :
         {std::pair<char const*, std::string const&>{"constraint system", paths.constraintSystem},
          {"witness program", paths.witnessProgram},
          {"proving key", paths.provingKey},
          {"verifying key", paths.verifyingKey}})
    {
        std::error_code ec;
        if (path.empty() || !fs::is_regular_file(path, ec))
        {
            if (!missing.empty())
                missing += ", ";
            missing += std::string(label) + " (" + path + ")";
        }
    }
    if (!missing.empty())
        throw CircuitLoadError("missing " + name + " artifacts: " + missing);

    auto const started = std::chrono::steady_clock::now();
    auto loaded = std::make_shared<LoadedCircuit>();
    loaded->paths = paths;

    auto& d = loaded->descriptor;
    d = CircuitDescriptor::fromJson(readJsonFile(paths.witnessProgram));
    if (d.id != id)
        throw CircuitLoadError(
            paths.witnessProgram + " describes " + to_string(d.id) + ", not " + name);
    if (d.numPublicInputs != publicInputCount(id))
        throw CircuitLoadError(
            paths.witnessProgram + " declares " + std::to_string(d.numPublicInputs) +
            " public inputs, " + name + " has " + std::to_string(publicInputCount(id)));

    std::unique_ptr<PoolCircuit> circuit;
    try
    {
        circuit = PoolCircuit::create(id, d.treeDepth);
    }
    catch (InputValidationError const& e)
    {
        throw CircuitLoadError(paths.witnessProgram + ": " + e.what());
    }
    auto const cs = circuit->getConstraintSystem();
    if (cs.num_constraints() != d.numConstraints || cs.num_variables() != d.numVariables)
        throw CircuitLoadError(
            paths.witnessProgram + " does not match the compiled " + name +
            " circuit at depth " + std::to_string(d.treeDepth));

    {
        libsnark::r1cs_constraint_system<FieldT> stored;
        std::ifstream in(paths.constraintSystem, std::ios::binary);
        in >> stored;
        if (in.fail())
            throw CircuitLoadError("cannot parse " + paths.constraintSystem);
        if (!(stored == cs))
            throw CircuitLoadError(
                paths.constraintSystem + " does not match the compiled " + name +
                " circuit");
    }

    {
        std::ifstream in(paths.provingKey, std::ios::binary);
        in >> loaded->provingKey;
        if (in.fail())
            throw CircuitLoadError("cannot parse " + paths.provingKey);
    }
    auto const& pkcs = loaded->provingKey.constraint_system;
    if (pkcs.num_constraints() != cs.num_constraints() ||
        pkcs.num_inputs() != cs.num_inputs() ||
        pkcs.num_variables() != cs.num_variables())
        throw CircuitLoadError(
            paths.provingKey + " was generated for a different constraint system");

    loaded->verifyingKey = VerifyingKey::fromJson(readJsonFile(paths.verifyingKey));
    auto const& vk = loaded->verifyingKey;
    if (vk.ic.size() != d.numPublicInputs + 1)
        throw CircuitLoadError(
            paths.verifyingKey + " has " + std::to_string(vk.ic.size()) +
            " IC points, expected " + std::to_string(d.numPublicInputs + 1));
    if (!(vk.alpha == loaded->provingKey.alpha_g1) ||
        !(vk.beta == loaded->provingKey.beta_g2) ||
        !(vk.delta == loaded->provingKey.delta_g2))
        throw CircuitLoadError(
            paths.verifyingKey + " does not belong to " + paths.provingKey);

    loaded->processedKey =
        libsnark::r1cs_gg_ppzksnark_verifier_process_vk<DefaultCurve>(vk.toSnark());

    auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    JLOG(j.info()) << "loaded " << name << " circuit: depth " << d.treeDepth << ", "
                   << d.numConstraints << " constraints in " << elapsed.count() << "ms";
    return loaded;
}

void
bootstrapCircuitArtifacts(
    CircuitId id, std::size_t treeDepth, CircuitArtifactPaths const& paths, Journal j)
{
    std::string const name = to_string(id);
    JLOG(j.warn()) << "bootstrapping " << name
                   << " keys locally; not for production use";

    auto circuit = PoolCircuit::create(id, treeDepth);
    auto const cs = circuit->getConstraintSystem();

    JLOG(j.info()) << name << " circuit has " << cs.num_constraints()
                   << " constraints, running key generator";
    auto const keypair = libsnark::r1cs_gg_ppzksnark_generator<DefaultCurve>(cs);

    CircuitDescriptor d;
    d.id = id;
    d.treeDepth = treeDepth;
    d.numPublicInputs = publicInputCount(id);
    d.numConstraints = cs.num_constraints();
    d.numVariables = cs.num_variables();

    writeFile(paths.constraintSystem, [&](std::ostream& out) { out << cs; });
    writeFile(paths.provingKey, [&](std::ostream& out) { out << keypair.pk; });
    writeJsonFile(paths.verifyingKey, verifyingKeyFromKeypair(keypair).toJson());
    // Written last: its presence marks a complete artifact set.
    writeJsonFile(paths.witnessProgram, d.toJson());

    JLOG(j.info()) << "wrote " << name << " artifacts";
}

}  // namespace zkp
}  // namespace umbra
