#include "sandbox/context_injector.hpp"

#include "errors.hpp"

namespace runbox::sandbox {

std::string ContextInjector::BuildPreamble(const nlohmann::json& context) {
    if (!context.is_object()) {
        throw ContextSerializationError(
            std::string("context must be a JSON object, got ") + context.type_name());
    }
    std::string payload;
    try {
        payload = context.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error& ex) {
        throw ContextSerializationError(ex.what());
    }
    // A JSON string literal is also a valid Python string literal.
    const auto literal = nlohmann::json(payload).dump(-1, ' ', false);

    std::string preamble;
    preamble += "import json as _runbox_json\n";
    preamble += "_context = _runbox_json.loads(" + literal + ")\n";
    // Drop the module alias first; a context key may use the same name.
    preamble += "del _runbox_json\n";
    preamble += "globals().update(_context)\n\n";
    return preamble;
}

std::string ContextInjector::Inject(const std::string& code, const nlohmann::json& context) {
    if (IsEmpty(context)) {
        return code;
    }
    return BuildPreamble(context) + code;
}

}  // namespace runbox::sandbox
