/**
 * @file exporter.h
 * @brief Export a gearbox frame to DXF or SVG files
 */

#ifndef CYCLODRIVE_EXPORTER_H
#define CYCLODRIVE_EXPORTER_H

#include "cyclodrive/core/parameters.h"
#include "cyclodrive/export/dxf_writer.h"
#include <string>

namespace cyclodrive {

    enum class ExportFormat {
        DXF,
        SVG,
    };

    const char* format_name(ExportFormat format);

    /**
     * @brief Format from a case-insensitive name ("dxf", "svg")
     * @throws cyclodrive::ExportUnavailableError for any other name
     */
    ExportFormat format_from_name(const std::string& name);

    /**
     * @brief Format from the file extension of a path
     * @throws cyclodrive::ExportUnavailableError for an unknown or missing extension
     */
    ExportFormat format_from_path(const std::string& path);

    /**
     * @brief Parse "R12", "R2000" or "R2010" (case-insensitive)
     * @throws cyclodrive::InvalidArgument for any other text
     */
    DxfVersion dxf_version_from_name(const std::string& name);

    struct ExportOptions {
        DxfVersion dxf_version = DxfVersion::R2010;
    };

    /**
     * @brief Generate the gearbox at export resolution and render it
     */
    std::string generate_document(ExportFormat format, const ParameterSet& params, double phi,
                                  const ExportOptions& options = ExportOptions());

    /**
     * @brief Write contents to path through a temporary sibling file
     *
     * The target is replaced only after the whole document has been written;
     * on failure the temporary file is removed and the target is untouched.
     * @throws cyclodrive::FileIOError with the underlying cause
     */
    void write_document(const std::string& path, const std::string& contents);

    /**
     * @brief Render the gearbox at phase phi and write it to path
     * @throws cyclodrive::ExportUnavailableError, cyclodrive::DegenerateGeometryError
     *         or cyclodrive::FileIOError; nothing is written on failure
     */
    void export_gearbox(const std::string& path, ExportFormat format, const ParameterSet& params, double phi,
                        const ExportOptions& options = ExportOptions());

} // namespace cyclodrive

#endif // CYCLODRIVE_EXPORTER_H
