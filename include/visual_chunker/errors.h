#pragma once

#include <stdexcept>
#include <string>

namespace visual_chunker {

// Format-specific parsing failed; the parser recovers with flat splitting
class StructureParseError : public std::runtime_error {
public:
    explicit StructureParseError(const std::string& what) : std::runtime_error(what) {}
};

// A visual's metadata is unusable; the visual is skipped for one chunk
class VisualEnhancementError : public std::runtime_error {
public:
    explicit VisualEnhancementError(const std::string& what) : std::runtime_error(what) {}
};

// The whole chunk_document() call failed, no partial result
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace visual_chunker
