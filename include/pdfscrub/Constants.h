/* Copyright (c) 2005-2022 Jay Berkenbilt
 *
 * This file is part of pdfscrub.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef PDFSCRUB_CONSTANTS_H
#define PDFSCRUB_CONSTANTS_H

/*
 * REMEMBER:
 *
 * Keep this file 'C' compatible. New values must be added to the end
 * of each enumeration so that no constant's numerical value changes.
 */

/* Error Codes */

enum scrub_error_code_e {
    scrub_e_success = 0,
    scrub_e_internal,                  /* logic/programming error -- indicates bug */
    scrub_e_config,                    /* invalid static configuration */
    scrub_e_structure,                 /* document root cannot be resolved */
    scrub_e_processing,                /* failure while processing one object */
    scrub_e_crypto,                    /* cipher or digest failure */
    scrub_e_pattern,                   /* malformed detection pattern */
    scrub_e_invalid_key_length,        /* key length not valid for the method */
    scrub_e_invalid_encryption_config, /* bad method/key length/revision */
    scrub_e_no_encryption_key,         /* operation requires a file key */
};

/* Object Types */

enum scrub_object_type_e {
    scrub_ot_null,
    scrub_ot_boolean,
    scrub_ot_integer,
    scrub_ot_real,
    scrub_ot_string,
    scrub_ot_name,
    scrub_ot_array,
    scrub_ot_dictionary,
    scrub_ot_stream,
    scrub_ot_reference,
};

/* Severity of scanner and detector findings, lowest first */

enum scrub_severity_e {
    scrub_sev_info = 0,
    scrub_sev_low,
    scrub_sev_medium,
    scrub_sev_high,
    scrub_sev_critical,
};

/* Encryption methods */

enum scrub_encryption_e {
    scrub_enc_rc4 = 0,
    scrub_enc_aes,
    scrub_enc_identity,
};

/* Categories of detection patterns */

enum scrub_pattern_type_e {
    scrub_pt_metadata = 0,
    scrub_pt_content,
    scrub_pt_structure,
    scrub_pt_binary,
    scrub_pt_custom,
    scrub_pt_steganography,
};

#endif /* PDFSCRUB_CONSTANTS_H */
