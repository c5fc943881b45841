//
// Dispatch of decoded records to registered handlers.
//

#include <oskar/handler_registry.hh>

namespace oskar {

    void handler_registry::on_record(std::uint8_t group_id, std::uint8_t tag_id, record_handler handler) {
        m_tag_handlers[make_key(group_id, tag_id)].push_back(std::move(handler));
    }

    void handler_registry::on_group(std::uint8_t group_id, record_handler handler) {
        m_group_handlers[group_id].push_back(std::move(handler));
    }

    void handler_registry::on_any(record_handler handler) {
        m_global_handlers.push_back(std::move(handler));
    }

    bool handler_registry::empty() const {
        return m_tag_handlers.empty() && m_group_handlers.empty() && m_global_handlers.empty();
    }

    std::size_t handler_registry::emit(const record& rec) const {
        // Collect all matching handlers with proper precedence
        std::vector<const record_handler*> handlers_to_call;

        auto tag_it = m_tag_handlers.find(make_key(rec.tag.group_id, rec.tag.tag_id));
        if (tag_it != m_tag_handlers.end()) {
            for (const auto& handler : tag_it->second) {
                handlers_to_call.push_back(&handler);
            }
        }

        auto group_it = m_group_handlers.find(rec.tag.group_id);
        if (group_it != m_group_handlers.end()) {
            for (const auto& handler : group_it->second) {
                handlers_to_call.push_back(&handler);
            }
        }

        for (const auto& handler : m_global_handlers) {
            handlers_to_call.push_back(&handler);
        }

        // Call all collected handlers
        for (const auto* handler : handlers_to_call) {
            (*handler)(rec);
        }
        return handlers_to_call.size();
    }

} // namespace oskar
