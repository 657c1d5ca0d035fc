/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_ERROR_CODE_H
#define VIGIL_ERROR_CODE_H

namespace vigil {
    namespace error {
        // JSON-RPC 2.0 error codes used on the control channel
        enum ErrorCode {
            EC_OK                   =  0,
            EC_JSON_MALFORMED       = -32700,
            EC_INVALID_REQUEST      = -32600,
            EC_METHOD_NOT_FOUND     = -32601,
            EC_UNKNOWN              = -9999
        };

        // process exit codes
        enum ExitCode {
            EXIT_OK                 = 0,
            EXIT_CONFIG_ERROR       = 1,
            EXIT_BROKER_FAILED      = 2,
            EXIT_DAEMON_FAILED      = 3,
            EXIT_ALREADY_RUNNING    = 4
        };
    }
} // namespace vigil

#endif /* ifndef VIGIL_ERROR_CODE_H */
