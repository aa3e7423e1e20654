#pragma once

#define MINTEX_MIN_ACCOUNT_NAME_LENGTH          3
#define MINTEX_MAX_ACCOUNT_NAME_LENGTH          16

#define MINTEX_MAX_NAME_LENGTH                  100

// Identifier ranges are half-open: [min, max)
#define MINTEX_COLLECTION_ID_MIN                1
#define MINTEX_COLLECTION_ID_MAX                1000001
#define MINTEX_TOKEN_ID_MIN                     0
#define MINTEX_TOKEN_ID_MAX                     999999

#define MINTEX_ID_ALLOCATION_ATTEMPTS           10

#define MINTEX_EXCHANGE_ACCOUNT                 "exchange"
#define MINTEX_INIT_ADMIN_NAME                  "admin"

#define MINTEX_DEFAULT_SHARED_FILE_SIZE         (64ull * 1024 * 1024)
