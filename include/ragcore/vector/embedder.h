#pragma once

#include <ragcore/core/types.h>

#include <string>
#include <string_view>

namespace ragcore::vector {

/**
 * @brief Text embedding model.
 *
 * Implementations must be deterministic for a given model and safe to call from several
 * threads. Failures are reported as EmbeddingUnavailable.
 */
class IEmbedder {
public:
    virtual ~IEmbedder() = default;

    virtual Result<Embedding> embed(std::string_view text) = 0;
    virtual std::string modelName() const = 0;
    virtual size_t dimension() const = 0;
};

} // namespace ragcore::vector
