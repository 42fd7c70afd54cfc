#include "GOAS.hpp"
#include "AdaptiveController.hpp"
#include "ConfigReader.hpp"
#include "ProblemLibrary.hpp"
#include <petsc.h>
#include <iostream>
#include <string>

static char help[] = "GOAS - Goal-Oriented Adaptive Solver\n"
                    "Usage: goas [options]\n\n"
                    "Options:\n"
                    "  -c <file>                Configuration file (.config)\n"
                    "  -override <file>         Configuration whose keys replace those of -c\n"
                    "  -problem <name>          Model problem: heat, burgers, poisson\n"
                    "  -o <folder>              Output folder\n"
                    "  -generate_config <file>  Write a configuration template\n\n"
                    "Examples:\n"
                    "  # Use configuration file (recommended)\n"
                    "  goas -c config/heat_adaptive.config\n\n"
                    "  # Same run with a finer initial mesh\n"
                    "  goas -c config/heat_adaptive.config -override fine.config\n\n"
                    "  # Adaptive Burgers run with defaults\n"
                    "  goas -problem burgers\n\n"
                    "  # Generate template configuration\n"
                    "  goas -generate_config my_config.config\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                try {
                    GOAS::ConfigReader::generateTemplate(generate_config);
                } catch (const std::exception& e) {
                    PetscPrintf(comm, "Error: %s\n", e.what());
                    ierr = PetscFinalize();
                    return 1;
                }
                PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                PetscPrintf(comm, "Edit this file to customize your run.\n");
            }
            ierr = PetscFinalize();
            return 0;
        }

        // Parse command line arguments
        char config_file[PETSC_MAX_PATH_LEN] = "";
        char problem_name[256] = "";
        char output_folder[PETSC_MAX_PATH_LEN] = "";
        char override_file[PETSC_MAX_PATH_LEN] = "";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool override_provided = PETSC_FALSE;
        PetscBool problem_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-problem", problem_name,
                                     sizeof(problem_name), &problem_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_folder,
                                     sizeof(output_folder), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-override", override_file,
                                     sizeof(override_file), &override_provided); CHKERRQ(ierr);

        if (override_provided && !config_provided) {
            if (rank == 0) {
                PetscPrintf(comm, "Error: -override needs a base configuration (-c)\n");
            }
            ierr = PetscFinalize();
            return 1;
        }

        if (!config_provided && !problem_provided) {
            if (rank == 0) {
                PetscPrintf(comm, "Error: Configuration file (-c) or problem name (-problem) required\n");
                PetscPrintf(comm, "Run with -help for usage information\n");
                PetscPrintf(comm, "Generate template: goas -generate_config template.config\n");
            }
            ierr = PetscFinalize();
            return 1;
        }

        GOAS::SolverOptions options;
        GOAS::ProblemParameters params;

        try {
            if (config_provided) {
                GOAS::ConfigReader config;
                if (!config.loadFile(config_file)) {
                    ierr = PetscFinalize();
                    return 1;
                }
                if (override_provided && !config.mergeFile(override_file)) {
                    ierr = PetscFinalize();
                    return 1;
                }

                auto validation = config.validate();
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

                config.parseSolverOptions(options);
                config.parseProblemParameters(params);

                if (options.verbosity > 1 && rank == 0) {
                    PetscPrintf(comm, "Effective configuration:\n");
                    for (const auto& section : config.getSections()) {
                        PetscPrintf(comm, "  [%s]\n", section.c_str());
                        for (const auto& key : config.getKeys(section)) {
                            PetscPrintf(comm, "    %s = %s\n", key.c_str(),
                                        config.getString(section, key).c_str());
                        }
                    }
                }
            } else {
                // Adaptive run with default settings
                options.adaptive = true;
            }

            if (problem_provided) params.name = problem_name;
            if (output_provided) {
                options.folder = output_folder;
                if (options.folder.back() != '/') options.folder += '/';
            }
        } catch (const std::exception& e) {
            PetscPrintf(comm, "\nError: %s\n", e.what());
            ierr = PetscFinalize();
            return 1;
        }

        if (rank == 0) {
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  GOAS - Goal-Oriented Adaptive Solver\n");
            PetscPrintf(comm, "  Version 1.0.0\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "\n");
            if (config_provided) {
                PetscPrintf(comm, "Config file:   %s\n", config_file);
            }
            if (override_provided) {
                PetscPrintf(comm, "Override:      %s\n", override_file);
            }
            PetscPrintf(comm, "Problem:       %s\n", params.name.c_str());
            PetscPrintf(comm, "Solver:        %s (theta = %g)\n", options.solver_name.c_str(),
                        options.theta);
            PetscPrintf(comm, "Adaptive:      %s (TOL = %g, metric %s)\n",
                        options.adaptive ? "yes" : "no", options.adaptive_tolerance,
                        GOAS::stoppingMetricName(options.stopping_metric));
            PetscPrintf(comm, "Output folder: %s\n", options.folder.c_str());
            PetscPrintf(comm, "\n");
        }

        try {
            std::unique_ptr<GOAS::IntervalProblem> problem = GOAS::createProblem(params);
            GOAS::AdaptiveController controller(options);
            GOAS::AdaptiveResult result;

            double start_time = MPI_Wtime();
            ierr = controller.solve(*problem, &result); CHKERRQ(ierr);
            double end_time = MPI_Wtime();

            if (rank == 0) {
                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "Final state:      %s\n", GOAS::adaptiveStateName(result.state));
                PetscPrintf(comm, "Adaptive iters:   %" PetscInt_FMT "\n", result.iterations);
                PetscPrintf(comm, "Cells:            %" PetscInt_FMT "\n", result.mesh->numCells());

                // Resolution the adaptive loop reached at the goal
                const PetscReal x_goal = problem->parameters().goal_center;
                const PetscInt goal_cell = result.mesh->findCell(x_goal);
                const GOAS::CellGeometry geom = result.mesh->cell(goal_cell);
                PetscPrintf(comm, "Goal cell:        %" PetscInt_FMT " at x = %g (h = %.3e, "
                            "level %" PetscInt_FMT ")\n", goal_cell, (double)x_goal,
                            (double)geom.h, result.mesh->level(goal_cell));
                if (result.has_functional) {
                    PetscPrintf(comm, "Functional:       %.10g\n", (double)result.functional_value);
                }
                for (const auto& rec : result.history) {
                    PetscPrintf(comm, "  iteration %2" PetscInt_FMT ": cells %6" PetscInt_FMT
                                "  dofs %6" PetscInt_FMT "  J %.8e  err_est %.3e  marked %"
                                PetscInt_FMT "\n", rec.iteration, rec.num_cells, rec.num_dofs,
                                (double)rec.functional_value, (double)rec.stopping_metric,
                                rec.cells_marked);
                }
                PetscPrintf(comm, "Total wall time:  %.2f seconds\n", end_time - start_time);
                PetscPrintf(comm, "============================================================\n");
            }
        } catch (const std::exception& e) {
            if (rank == 0) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
            }
            ierr = PetscFinalize();
            return 1;
        }
    }

    // Finalize PETSc
    ierr = PetscFinalize();
    return ierr;
}
