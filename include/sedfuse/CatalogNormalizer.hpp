#pragma once
#include "Source.hpp"
#include "CatalogTable.hpp"
#include <cstddef>
#include <string>

namespace sedfuse {

// Outcome of feeding one catalog response into a Source.  `ok == false` is a
// soft failure: the batch goes on, the reason is only logged.
struct NormalizeResult {
    bool        ok    = false;
    std::size_t added = 0;
    std::string reason;

    static NormalizeResult success(std::size_t n) { return {true, n, {}}; }
    static NormalizeResult failure(std::string why) { return {false, 0, std::move(why)}; }
};

/*
 *  Turns one catalog response into Source state.  Implementations must not
 *  throw for missing columns, empty tables or fully filtered responses.
 */
class CatalogNormalizer {
public:
    virtual ~CatalogNormalizer() = default;

    virtual const std::string& label() const = 0;
    virtual NormalizeResult normalize(Source& source, const CatalogTable& table) const = 0;
};

} // namespace sedfuse
