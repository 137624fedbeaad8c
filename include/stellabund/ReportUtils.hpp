#pragma once
#include "Types.hpp"
#include "ReferenceSystem.hpp"
#include <nlohmann/json.hpp>
#include <iosfwd>
#include <string>

namespace stellabund {

/* --------------------------------------------------------------------- */
/*        aligned text table: one row per element, one column per star   */
/* --------------------------------------------------------------------- */
void write_table(std::ostream&          os,
                 const ReferenceSystem& system,
                 const AbundanceTable&  table,
                 int                    precision = 3);

/* element -> number for a single star, element -> array otherwise       */
nlohmann::json to_json(const AbundanceTable& table);

} // namespace stellabund
