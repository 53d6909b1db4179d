// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Unit conversion and meteorological constants.
 */

#ifndef _AW_CONSTANTS_H
#define _AW_CONSTANTS_H

/** Statute miles to meters */
#define AW_SM_TO_METER            1609.344

/** Cloud base code (hundreds of feet) to meters, as the decoded reports use it */
#define AW_CLOUD_CODE_TO_METER    30

/** Sentinel visibility for 9999 and CAVOK, in meters */
#define AW_VISIBILITY_UNLIMITED_M 10000

/** Inches of mercury to hectopascal, as applied to A-group altimeter settings */
#define AW_INHG_TO_HPA            33.8639

/** hectopascal to the Q-group secondary unit: x 3 / 4 */
#define AW_HPA_TO_Q_NUMERATOR     3.0
#define AW_HPA_TO_Q_DENOMINATOR   4.0

/** Millimeters of mercury to hectopascal */
#define AW_MMHG_TO_HPA            1.33322

/** Magnus formula coefficients (Alduchov & Eskridge) */
#define AW_MAGNUS_B               17.625
#define AW_MAGNUS_C               243.04

#endif // _AW_CONSTANTS_H
