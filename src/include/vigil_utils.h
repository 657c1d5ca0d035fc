/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_UTILS_H_
#define VIGIL_UTILS_H_

#include <stdint.h>
#include <random>
#include <string>
#include <vector>

namespace vigil_utils {
    /**
     * Uniform random number source
     */
    class Randomizer {
    public:
        /**
         * Seed from std::random_device
         */
        Randomizer();

        /**
         * Fixed seed (reproducible sequence)
         * @param[in]   seed    Generator seed
         */
        explicit Randomizer(uint32_t seed);

        /**
         * Generate uniformly distributed real number
         * @param[in]   lo  Lower bound (inclusive)
         * @param[in]   hi  Upper bound (inclusive)
         * @return      Random number in [lo, hi]
         */
        double uniform(double lo, double hi);

    private:
        std::mt19937 gen;
    };

    /**
     * Get file size
     * @param[in]   filename    Path to file
     * @return      File size in bytes or 0 if file cannot be opened
     */
    int get_file_size(const char *filename);

    /**
     * Load file contents
     * @param[in]       filename        Path to file
     * @param[out]      result          Output buffer
     * @param[in,out]   result_size     Output buffer size/number of bytes read
     * @return          0 for success, 1 if error occurred
     */
    int load_file(const char *filename, char *result, int *result_size);

    /**
     * Close all file descriptors above stderr
     * @return  Number of closed descriptors
     */
    int close_inherited_fds();

    /**
     * Write current PID to file
     * @param[in]   filename    Path to PID file
     * @return      0 for success, 1 if error occurred
     */
    int write_pid_file(const std::string &filename);

    /**
     * Split string
     * @param[in]   s       Input string
     * @param[in]   delim   Delimiter
     * @return      List of non empty tokens
     */
    std::vector<std::string> tokenize(const std::string &s, char delim);
}

#endif /* VIGIL_UTILS_H_ */
