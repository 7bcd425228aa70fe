/*
    Strictbf - A bounds-checked brainfuck interpreter
    Compile-time configuration
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#define STRICTBF_TAPE_SIZE 30000
#define STRICTBF_CELL_MAX 255
#define STRICTBF_DEFAULT_EOF_BEHAVIOUR 0
#define STRICTBF_SOURCE_EXTENSION ".bf"
