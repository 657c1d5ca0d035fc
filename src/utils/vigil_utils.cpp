/*
 * SPDX-License-Identifier: MIT
 *
 */

#include <vigil_utils.h>
#include <dirent.h>
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>
#include <fstream>
#include <boost/tokenizer.hpp>

vigil_utils::Randomizer::Randomizer() {
    std::random_device rd;
    gen.seed(rd());
}

vigil_utils::Randomizer::Randomizer(uint32_t seed) : gen(seed) {

}

double vigil_utils::Randomizer::uniform(double lo, double hi) {
    if (hi <= lo) return lo;
    std::uniform_real_distribution<double> dis(lo, hi);
    return dis(gen);
}

int vigil_utils::get_file_size(const char *filename) {
    std::ifstream ifs(filename,
                      std::ios::binary | std::ios::in | std::ios::ate);
    if (ifs.is_open()) {
        int fsize = ifs.tellg();
        ifs.close();
        return fsize;
    }
    return 0;
}

int vigil_utils::load_file(const char *filename,
                           char *result,
                           int *result_size) {
    std::ifstream ifs(filename,
                      std::ios::binary |
                      std::ios::in |
                      std::ios::ate);
    if (!ifs.is_open()) {
        *result_size = 0;
        return 1;
    }
    int fsize = ifs.tellg();
    // do not overflow output buffer
    if (fsize > *result_size) fsize = *result_size;
    ifs.seekg(0, std::ios::beg);
    ifs.read(result, (long)fsize);
    *result_size = ifs.gcount();
    ifs.close();
    return 0;
}

int vigil_utils::close_inherited_fds() {
    std::vector<int> fds;
    // list open descriptors
    DIR *d = opendir("/proc/self/fd");
    if (d != nullptr) {
        int dfd = dirfd(d);
        struct dirent *de;
        while ((de = readdir(d)) != nullptr) {
            if (de->d_name[0] == '.') continue;
            int fd = atoi(de->d_name);
            if (fd > STDERR_FILENO && fd != dfd) fds.push_back(fd);
        }
        closedir(d);

    // no procfs, try the whole range
    } else {
        long max_fd = sysconf(_SC_OPEN_MAX);
        if (max_fd < 0) max_fd = 1024;
        for (long fd = STDERR_FILENO + 1; fd < max_fd; fd++) {
            if (fcntl(fd, F_GETFD) != -1) fds.push_back(fd);
        }
    }

    // close
    int c = 0;
    for (int fd : fds) {
        if (close(fd) == 0) ++c;
    }
    return c;
}

int vigil_utils::write_pid_file(const std::string &filename) {
    std::ofstream ofs(filename, std::ios::out | std::ios::trunc);
    if (!ofs.is_open()) return 1;
    ofs << getpid() << std::endl;
    return ofs.good() ? 0 : 1;
}

std::vector<std::string> vigil_utils::tokenize(const std::string &s, char delim) {
    std::vector<std::string> res;
    const char sep[2] = {delim, '\0'};
    boost::char_separator<char> cs(sep);
    boost::tokenizer<boost::char_separator<char> > tok(s, cs);
    for (auto it = tok.begin(); it != tok.end(); ++it) res.push_back(*it);
    return res;
}
