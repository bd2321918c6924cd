/**
 *  @file  docs/Docs.h
 *
 *  @brief  Extra doxygen documentation
 */

// -----------------------------------------------------------------------------------------------------------------------------------------

/**
 *  @namespace histpost
 *
 *  @brief  The main histpost namespace
 */

// -----------------------------------------------------------------------------------------------------------------------------------------

/**
 *  @namespace histpost::log
 *
 *  @brief  Prefixed key=value log lines shared by the libraries and the executables
 */

// -----------------------------------------------------------------------------------------------------------------------------------------

/**
 *  @namespace histpost::app
 *
 *  @brief  Argument parsing and guarded execution for the command-line entry points
 */

// -----------------------------------------------------------------------------------------------------------------------------------------

/**
 *  @mainpage
 *
 *  histpost post-processes the histogram files of a sharded ttbar analysis.
 *
 *  - `histpostMerge OUTPUT.root PARTIAL.root...` concatenates the shards, strips
 *    column and weight suffixes from the names, adds `<region>_pseudodata` and
 *    stores an `AGC_metadata` JSON blob with the names, integrals, luminosity and
 *    per-process event counts.
 *  - `histpostScale FILE.root...` scales every histogram to cross section times
 *    luminosity, preferring the event counts of the metadata blob over the
 *    histogram integral, and copies everything else verbatim.
 *  - `histpostSplitInputs [MANIFEST] [OUTDIR]` splits `nanoaod_inputs.json`
 *    into one manifest per process.
 *
 *  Libraries: `histpost_core` (names, constants, records, logging),
 *  `histpost_io` (ROOT container, metadata codec, input manifest) and
 *  `histpost_ana` (scale factors, merge, pseudodata, scaling pass).
 */
