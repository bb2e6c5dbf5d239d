#pragma once

#include "core/plugin/IScanScript.hpp"

namespace portprobe::plugins {

/**
 * @brief Example script reporting the well-known service of each open port.
 *
 * The host-level run only acknowledges the host; per-port runs put the
 * service name into the result's data under "service".
 */
class ServiceNameScript : public core::IScanScript {
public:
    ServiceNameScript();

    [[nodiscard]] const core::ScriptMetadata& metadata() const override { return metadata_; }

    core::ScriptResult run(const std::string& host, std::optional<uint16_t> port) override;

private:
    core::ScriptMetadata metadata_;
};

} // namespace portprobe::plugins

extern "C" {
    portprobe::core::IScanScript* portprobe_create_script();
    void portprobe_destroy_script(portprobe::core::IScanScript* script);
}
