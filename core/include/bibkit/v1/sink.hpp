#pragma once

#include "bibkit/v1/diagnostics.hpp"
#include "bibkit/v1/engine.hpp"
#include "bibkit/v1/paper.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <ostream>

namespace bibkit::v1 {

// nlohmann::json conversions (found by ADL).
void to_json(nlohmann::json& j, const Paper& paper);
void to_json(nlohmann::json& j, const Diagnostic& diagnostic);

/// Destination for accepted papers (database, index, file...).
class PaperSink {
public:
    virtual ~PaperSink() = default;

    virtual void accept(const Paper& paper) = 0;
    virtual void finish() {}
};

/// Writes one compact JSON object per line.
class JsonLinesSink final : public PaperSink {
public:
    explicit JsonLinesSink(std::ostream& out) : out_(out) {}

    void accept(const Paper& paper) override;
    void finish() override;

    [[nodiscard]] std::size_t written() const noexcept { return written_; }

private:
    std::ostream& out_;
    std::size_t written_ = 0;
};

/// Hand every paper of `result` to `sink` in output order, then finish().
/// Returns the number of papers handed over.
std::size_t publish(const IngestResult& result, PaperSink& sink);

}  // namespace bibkit::v1
