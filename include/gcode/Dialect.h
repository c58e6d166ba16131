// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef GCODE_DIALECT_H
#define GCODE_DIALECT_H

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "gcode/Command.h"

namespace travel
{

/*!
 * \brief Table of the G-codes the parser recognises and what category each belongs to.
 *
 * Firmware flavours differ mostly in which M-codes they emit, so the table is data, not code: it can be extended with
 * extra passthrough codes from the configuration.
 */
class Dialect
{
public:
    /*!
     * The codes emitted by the common FFF slicers for Marlin-like firmware (Cura, PrusaSlicer and derivatives).
     */
    static Dialect marlin();

    /*!
     * Register a code, replacing its category if it was already known.
     * \param code The code, e.g. "M862.3". Stored normalised.
     */
    void add(std::string_view code, CommandCategory category);

    /*!
     * Register codes that are known to have no effect on the position.
     */
    void addPassthrough(const std::vector<std::string>& codes);

    /*!
     * Look up a normalised code.
     * \return The category, or nothing if the code isn't part of this dialect.
     */
    [[nodiscard]] std::optional<CommandCategory> categorize(const std::string& code) const;

    [[nodiscard]] size_t size() const
    {
        return table_.size();
    }

    /*!
     * Normalise a code as written in a file: upper case and without leading zeros in the number, so "g01" becomes "G1"
     * and "M862.3" stays "M862.3".
     */
    [[nodiscard]] static std::string normalize(std::string_view code);

private:
    std::unordered_map<std::string, CommandCategory> table_;
};

} // namespace travel

#endif // GCODE_DIALECT_H
