// =====================================================================
//  src/floorplan/main.cpp — floorplan command-line tool
// =====================================================================
//
//  Usage:
//    floorplan --convert <input.json> <output.svg|.dxf|.json> [flags]
//    floorplan --info <input.json>
//
//  Input is either a captured surface list or a saved floor plan.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <floorplan/core.h>

#include "cli/climode.h"

#include <QString>

#include <iostream>

// ---- Helper: command-line flags --------------------------------------

struct StartupFlags {
    bool convert = false;
    bool info    = false;
    bool help    = false;
    bool version = false;
    QString input;
    QString output;
    floorplan::ConvertOptions convertOptions;
    QString unknown;        // First unrecognized argument
};

static StartupFlags parseFlags(int argc, char* argv[])
{
    StartupFlags flags;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == QLatin1String("--convert") && i + 2 < argc) {
            flags.convert = true;
            flags.input   = QString::fromLocal8Bit(argv[++i]);
            flags.output  = QString::fromLocal8Bit(argv[++i]);
        }
        else if (arg == QLatin1String("--info") && i + 1 < argc) {
            flags.info  = true;
            flags.input = QString::fromLocal8Bit(argv[++i]);
        }
        else if (arg == QLatin1String("--no-dimensions")) {
            flags.convertOptions.includeDimensions = false;
        }
        else if (arg == QLatin1String("--unrotated")) {
            flags.convertOptions.exportOptions.svg.applyRotation = false;
        }
        else if (arg == QLatin1String("--dxf-openings")) {
            flags.convertOptions.exportOptions.dxf.includeOpenings = true;
        }
        else if (arg == QLatin1String("--help") || arg == QLatin1String("-h")) {
            flags.help = true;
        }
        else if (arg == QLatin1String("--version")) {
            flags.version = true;
        }
        else if (flags.unknown.isEmpty()) {
            flags.unknown = arg;
        }
    }

    return flags;
}

static void printUsage(std::ostream& out)
{
    out << "Usage:\n"
        << "  floorplan --convert <input.json> <output> [options]\n"
        << "  floorplan --info <input.json>\n"
        << "\n"
        << "Input is a captured surface list or a saved floor plan (JSON).\n"
        << "Output format follows the extension: .svg, .dxf or .json.\n"
        << "\n"
        << "Options:\n"
        << "  --no-dimensions   Omit room width/depth annotations\n"
        << "  --unrotated       SVG: draw elements without their rotation\n"
        << "  --dxf-openings    DXF: include openings on an OPENINGS layer\n"
        << "  --version         Print the library version\n"
        << "  -h, --help        Show this help\n";
}

// ---- main ------------------------------------------------------------

int main(int argc, char* argv[])
{
    StartupFlags flags = parseFlags(argc, argv);

    if (flags.version) {
        std::cout << "floorplan " << floorplan::version() << std::endl;
        return 0;
    }

    if (flags.help) {
        printUsage(std::cout);
        return 0;
    }

    if (!flags.unknown.isEmpty()) {
        std::cerr << "Error: unrecognized argument \""
                  << flags.unknown.toStdString() << "\"." << std::endl;
        printUsage(std::cerr);
        return 1;
    }

    floorplan::CliMode cli;

    if (flags.convert) {
        return cli.runConvert(flags.input, flags.output, flags.convertOptions);
    }
    if (flags.info) {
        return cli.runInfo(flags.input);
    }

    printUsage(std::cerr);
    return 1;
}
