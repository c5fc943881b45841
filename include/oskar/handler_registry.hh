/**
 * @file handler_registry.hh
 * @brief Routing of decoded records to callbacks by group and tag
 */

#pragma once

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>
#include <oskar/export_oskar.h>
#include <oskar/record.hh>

namespace oskar {

    /**
     * @typedef record_handler
     * @brief Function type for record handlers
     */
    using record_handler = std::function<void(const record& rec)>;

    /**
     * @class handler_registry
     * @brief Registry for record handlers with precedence rules
     *
     * Supports three levels of handler specificity:
     * 1. Group and tag specific handlers (highest precedence)
     * 2. Group specific handlers
     * 3. Global handlers (lowest precedence)
     *
     * Multiple handlers can be registered for the same key; they are
     * called in registration order.
     */
    class OSKAR_EXPORT handler_registry {
    public:
        /**
         * @brief Register handler for records with the given group and tag ID
         */
        void on_record(std::uint8_t group_id, std::uint8_t tag_id, record_handler handler);

        /**
         * @brief Register handler for every record of a group
         */
        void on_group(std::uint8_t group_id, record_handler handler);

        /**
         * @brief Register handler for every record
         */
        void on_any(record_handler handler);

        /**
         * @brief Call all matching handlers in precedence order
         * @return Number of handlers called
         */
        std::size_t emit(const record& rec) const;

        [[nodiscard]] bool empty() const;

    private:
        static std::uint16_t make_key(std::uint8_t group_id, std::uint8_t tag_id) {
            return static_cast<std::uint16_t>((group_id << 8) | tag_id);
        }

        std::unordered_map<std::uint16_t, std::vector<record_handler>> m_tag_handlers;
        std::unordered_map<std::uint8_t, std::vector<record_handler>> m_group_handlers;
        std::vector<record_handler> m_global_handlers;
    };

} // namespace oskar
