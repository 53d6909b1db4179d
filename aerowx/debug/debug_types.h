// SPDX-License-Identifier: LGPL-2.1-or-later

#pragma once

/**
 * Define the various logging classes and priorities
 */

/**
 * Define the possible classes/categories of logging messages
 */
typedef enum {
    AW_NONE     = 0x00000000,

    AW_GENERAL  = 0x00000001,
    AW_METAR    = 0x00000002,
    AW_TAF      = 0x00000004,
    AW_REMARKS  = 0x00000008,
    AW_PRINTER  = 0x00000010,
    AW_IO       = 0x00000020,
    AW_UNDEFD   = 0x00000040, // For range checking

    AW_ALL      = 0x0000007F
} awDebugClass;


/**
 * Define the possible logging priorities (and their order).
 */
typedef enum {
    AW_BULK = 1,  // For frequent messages (per token)
    AW_DEBUG,     // Less frequent debug type messages
    AW_INFO,      // Informatory messages
    AW_WARN,      // Possible impending problem
    AW_ALERT      // Very possible impending problem
} awDebugPriority;
