//! # Annotation Extraction Implementation

#include "frontend/annotations.hpp"

#include "log/log.hpp"

namespace recname::frontend {

namespace {

enum class AnnotationKind { Name, Namespace, Erased, Other };

auto classify(std::string_view kind) -> AnnotationKind {
    if (kind == "name" || kind == "AvroName")
        return AnnotationKind::Name;
    if (kind == "namespace" || kind == "AvroNamespace")
        return AnnotationKind::Namespace;
    if (kind == "erased" || kind == "AvroErasedName")
        return AnnotationKind::Erased;
    return AnnotationKind::Other;
}

} // namespace

auto parse_annotation(std::string_view text) -> Annotation {
    size_t eq = text.find('=');
    if (eq == std::string_view::npos) {
        return Annotation{std::string(text), std::nullopt};
    }
    return Annotation{std::string(text.substr(0, eq)), std::string(text.substr(eq + 1))};
}

auto extract_overrides(std::span<const Annotation> annotations)
    -> Result<naming::OverrideSet, std::string> {
    naming::OverrideSet overrides;

    for (const auto& annotation : annotations) {
        switch (classify(annotation.kind)) {
        case AnnotationKind::Name:
            if (!annotation.value) {
                return "annotation '" + annotation.kind + "' requires a value";
            }
            if (overrides.name) {
                RECNAME_LOG_DEBUG("annotations", "ignoring repeated '"
                                                     << annotation.kind << "' = '"
                                                     << *annotation.value << "'");
                break;
            }
            overrides.name = *annotation.value;
            break;
        case AnnotationKind::Namespace:
            if (!annotation.value) {
                return "annotation '" + annotation.kind + "' requires a value";
            }
            if (overrides.namespace_name) {
                RECNAME_LOG_DEBUG("annotations", "ignoring repeated '"
                                                     << annotation.kind << "' = '"
                                                     << *annotation.value << "'");
                break;
            }
            overrides.namespace_name = *annotation.value;
            break;
        case AnnotationKind::Erased:
            if (annotation.value) {
                return "annotation '" + annotation.kind + "' takes no value";
            }
            overrides.erased = true;
            break;
        case AnnotationKind::Other:
            RECNAME_LOG_TRACE("annotations", "skipping unrelated annotation '" << annotation.kind
                                                                              << "'");
            break;
        }
    }

    return overrides;
}

} // namespace recname::frontend
