#include <dsexport/cli/export_command.h>

#include <CLI/CLI.hpp>

int main(int argc, char** argv) {
    CLI::App app{"Bulk export of DocuSign envelope documents", "dsexport"};

    dsexport::cli::ExportCliOptions opts;
    dsexport::cli::registerExportOptions(app, opts);

    CLI11_PARSE(app, argc, argv);

    return dsexport::cli::runExport(opts);
}
