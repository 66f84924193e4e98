#include "GeoProfile.hpp"
#include "ConfigReader.hpp"
#include "ProfilePipeline.hpp"
#include "GnuplotEncoder.hpp"
#include "ProfileService.hpp"
#include "HttpServer.hpp"
#include <petsc.h>
#include <csignal>
#include <cstring>
#include <fstream>
#include <memory>
#include <string>

static char help[] = "GeoProfile - Earth Depth Profile Generator\n"
                    "Usage: geoprofile [options]\n\n"
                    "Options:\n"
                    "  -c <file>                Configuration file (.config)\n"
                    "  -generate_config <file>  Write a template configuration and exit\n"
                    "  -seed <n>                Random stream seed (default 678)\n"
                    "  -port <n>                Listening port (default 5000)\n"
                    "  -o <file>                Render once to <file> instead of serving\n"
                    "  -format <pdf|png>        Format for -o (default pdf)\n"
                    "  -verbose                 Log stage timings and statistics\n\n"
                    "Examples:\n"
                    "  # Serve POST /generate-pdf, POST /generate-image and GET /\n"
                    "  geoprofile -c config/earth_depth_profile.config\n\n"
                    "  # Write the chart to disk\n"
                    "  geoprofile -o earth_depth_profile.png -format png\n\n"
                    "  # Generate template configuration\n"
                    "  geoprofile -generate_config my_profile.config\n\n";

static GeoProfile::HttpServer* g_server = nullptr;

static void handleSignal(int) {
    if (g_server) g_server->stop();
}

static PetscErrorCode renderToFile(MPI_Comm comm, const GeoProfile::ProfileConfig& profile,
                                   const GeoProfile::RenderConfig& render,
                                   const char* output_file, const char* format) {
    GeoProfile::OutputFormat fmt;
    if (std::strcmp(format, "pdf") == 0) {
        fmt = GeoProfile::OutputFormat::DOCUMENT;
    } else if (std::strcmp(format, "png") == 0) {
        fmt = GeoProfile::OutputFormat::RASTER;
    } else {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Unknown -format, expected pdf or png");
    }

    GeoProfile::ProfilePipeline pipeline(profile);
    GeoProfile::GnuplotEncoder encoder(render, fmt);

    PetscPrintf(comm, "Generating profile...\n");
    GeoProfile::ChartScene scene = pipeline.generate();

    PetscPrintf(comm, "Rendering %s...\n", encoder.contentType().c_str());
    std::string bytes = encoder.encode(scene);

    std::ofstream out(output_file, std::ios::binary);
    if (!out) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Cannot open output file");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        SETERRQ(comm, PETSC_ERR_FILE_WRITE, "Failed writing output file");
    }

    PetscPrintf(comm, "Wrote %d bytes to %s\n", static_cast<int>(bytes.size()), output_file);
    return 0;
}

static PetscErrorCode serve(MPI_Comm comm, const GeoProfile::ProfileConfig& profile,
                            const GeoProfile::RenderConfig& render,
                            const GeoProfile::ServerConfig& server_config) {
    auto document = std::make_shared<GeoProfile::GnuplotEncoder>(
        render, GeoProfile::OutputFormat::DOCUMENT);
    auto raster = std::make_shared<GeoProfile::GnuplotEncoder>(
        render, GeoProfile::OutputFormat::RASTER);

    if (!GeoProfile::GnuplotEncoder::available(render.gnuplot)) {
        PetscPrintf(comm, "Warning: '%s' not found; generation requests will fail\n",
                    render.gnuplot.c_str());
    }

    GeoProfile::ProfileService service(profile, document, raster);
    GeoProfile::HttpServer server(server_config,
        [&service](const GeoProfile::HttpRequest& req) { return service.handle(req); });

    server.open();
    g_server = &server;
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    PetscPrintf(comm, "Listening on http://%s:%d\n", server_config.host.c_str(), server.port());
    PetscPrintf(comm, "  POST /generate-pdf\n");
    PetscPrintf(comm, "  POST /generate-image\n");
    PetscPrintf(comm, "  GET  /\n");
    PetscPrintf(comm, "Press Ctrl-C to stop.\n\n");

    server.serve();

    g_server = nullptr;
    PetscPrintf(comm, "Server stopped.\n");
    return 0;
}

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // Single-rank service
        if (rank != 0) {
            ierr = PetscFinalize();
            return 0;
        }

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (!GeoProfile::ConfigReader::generateTemplate(generate_config)) {
                ierr = PetscFinalize();
                return 1;
            }
            PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
            PetscPrintf(comm, "Edit this file to customize the profile.\n");
            ierr = PetscFinalize();
            return 0;
        }

        // Parse command line arguments
        char config_file[PETSC_MAX_PATH_LEN] = "";
        char output_file[PETSC_MAX_PATH_LEN] = "";
        char output_format[256] = "pdf";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;
        PetscBool seed_set = PETSC_FALSE, port_set = PETSC_FALSE, verbose_set = PETSC_FALSE;
        PetscInt seed = 0, port = 0;
        PetscBool verbose = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_file,
                                     sizeof(output_file), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-format", output_format,
                                     sizeof(output_format), nullptr); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-seed", &seed, &seed_set); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-port", &port, &port_set); CHKERRQ(ierr);
        ierr = PetscOptionsGetBool(nullptr, nullptr, "-verbose", &verbose, &verbose_set); CHKERRQ(ierr);

        GeoProfile::ProfileConfig profile;
        GeoProfile::RenderConfig render;
        GeoProfile::ServerConfig server;

        if (config_provided) {
            GeoProfile::ConfigReader reader;
            if (!reader.loadFile(config_file)) {
                ierr = PetscFinalize();
                return 1;
            }

            auto validation = reader.validate();
            for (const auto& w : validation.warnings) {
                PetscPrintf(comm, "Warning: %s\n", w.c_str());
            }
            if (!validation.valid) {
                for (const auto& e : validation.errors) {
                    PetscPrintf(comm, "Error: %s\n", e.c_str());
                }
                ierr = PetscFinalize();
                return 1;
            }

            reader.parseProfileConfig(profile);
            reader.parseRenderConfig(render);
            reader.parseServerConfig(server);
        }

        // Command line overrides the file
        if (seed_set) {
            if (seed < 0) {
                PetscPrintf(comm, "Error: -seed must be non-negative\n");
                ierr = PetscFinalize();
                return 1;
            }
            profile.seed = static_cast<std::uint32_t>(seed);
        }
        if (port_set) {
            if (!ConfigReader::validPort(static_cast<long>(port))) {
                PetscPrintf(comm, "Error: -port must be in 1..65535\n");
                ierr = PetscFinalize();
                return 1;
            }
            server.port = static_cast<int>(port);
        }
        if (verbose_set) profile.verbose = (verbose == PETSC_TRUE);

        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "  GeoProfile - Earth Depth Profile Generator\n");
        PetscPrintf(comm, "  Version 1.0.0\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "\n");
        if (config_provided) {
            PetscPrintf(comm, "Config file:   %s\n", config_file);
        }
        PetscPrintf(comm, "Seed:          %u\n", profile.seed);
        PetscPrintf(comm, "Samples:       %d\n", profile.n_points);
        PetscPrintf(comm, "Grid:          %d x %d\n", profile.grid_resolution, profile.grid_resolution);
        PetscPrintf(comm, "\n");

        try {
            if (output_provided) {
                ierr = renderToFile(comm, profile, render, output_file, output_format); CHKERRQ(ierr);
            } else {
                ierr = serve(comm, profile, render, server); CHKERRQ(ierr);
            }
        } catch (const std::exception& e) {
            PetscPrintf(comm, "\nError: %s\n", e.what());
            ierr = PetscFinalize();
            return 1;
        }
    }

    // Finalize PETSc
    ierr = PetscFinalize();
    return 0;
}
