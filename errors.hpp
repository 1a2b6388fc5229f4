/* ──────────────────────────────────────────────────────────────
   errors.hpp     –  exception taxonomy shared by core & front-ends
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <stdexcept>
#include <string>

namespace raydef {

struct Error : std::runtime_error {
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

/* fit() with < 2 samples or all sizes identical */
struct InsufficientData : Error {
    explicit InsufficientData(const std::string& msg) : Error(msg) {}
};

/* artifact exists but does not decode into a valid model */
struct CorruptArtifact : Error {
    explicit CorruptArtifact(const std::string& msg) : Error(msg) {}
};

/* no model in memory and the implicit load found nothing */
struct ModelNotReady : Error {
    explicit ModelNotReady(const std::string& msg) : Error(msg) {}
};

/* what DefectPredictor::predict reports to its callers */
struct ModelUnavailable : ModelNotReady {
    explicit ModelUnavailable(const std::string& msg) : ModelNotReady(msg) {}
};

struct InvalidDuration : Error {
    explicit InvalidDuration(const std::string& msg) : Error(msg) {}
};

struct InvalidInput : Error {
    explicit InvalidInput(const std::string& msg) : Error(msg) {}
};

/* training CSV missing or malformed */
struct DataError : Error {
    explicit DataError(const std::string& msg) : Error(msg) {}
};

}  // namespace raydef
