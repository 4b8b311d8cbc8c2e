#pragma once

// FontAwesome 6 Free Solid glyphs used by the QDevKit panels
// Usage: ImGui::Text(ICON_FA_COPY " Copy");

// Icon font range for FontAwesome 6
#define ICON_MIN_FA 0xe005
#define ICON_MAX_FA 0xf8ff

// UTF-8 byte sequences so every compiler sees the same bytes

// Tools (sidebar)
#define ICON_FA_TOOLBOX             "\xef\x95\x92"  // U+F552
#define ICON_FA_CODE                "\xef\x84\xa1"  // U+F121 - JSON formatter
#define ICON_FA_LOCK                "\xef\x80\xa3"  // U+F023 - Base64
#define ICON_FA_FINGERPRINT         "\xef\x95\xb7"  // U+F577 - UUID
#define ICON_FA_ID_CARD             "\xef\x8b\x82"  // U+F2C2 - JWT
#define ICON_FA_LINK                "\xef\x83\x81"  // U+F0C1 - URL
#define ICON_FA_CLOCK               "\xef\x80\x97"  // U+F017 - Timestamp
#define ICON_FA_HASHTAG             "\x23"          // #      - Hash
#define ICON_FA_FILTER              "\xef\x82\xb0"  // U+F0B0 - JSONPath
#define ICON_FA_SCROLL              "\xef\x9c\x8e"  // U+F70E - Logs

// Actions
#define ICON_FA_PLAY                "\xef\x81\x8b"  // U+F04B
#define ICON_FA_WAND_MAGIC_SPARKLES "\xee\x8b\x8a"  // U+E2CA
#define ICON_FA_COMPRESS            "\xef\x81\xa6"  // U+F066
#define ICON_FA_COPY                "\xef\x83\x85"  // U+F0C5
#define ICON_FA_PASTE               "\xef\x83\xaa"  // U+F0EA
#define ICON_FA_TRASH               "\xef\x87\xb8"  // U+F1F8
#define ICON_FA_ERASER              "\xef\x84\xad"  // U+F12D
#define ICON_FA_RIGHT_LEFT          "\xef\x8d\xa2"  // U+F362 - swap
#define ICON_FA_ARROW_DOWN          "\xef\x81\xa3"  // U+F063
#define ICON_FA_ARROW_UP            "\xef\x81\xa2"  // U+F062
#define ICON_FA_LOCK_OPEN           "\xef\x8f\x81"  // U+F3C1
#define ICON_FA_FLOPPY_DISK         "\xef\x83\x87"  // U+F0C7
#define ICON_FA_CLOCK_ROTATE_LEFT   "\xef\x87\x9a"  // U+F1DA - history
#define ICON_FA_CALENDAR            "\xef\x84\xb3"  // U+F133
#define ICON_FA_MAGNIFYING_GLASS    "\xef\x80\x82"  // U+F002
#define ICON_FA_PALETTE             "\xef\x94\xbf"  // U+F53F

// Status
#define ICON_FA_CIRCLE_CHECK        "\xef\x81\x98"  // U+F058
#define ICON_FA_CIRCLE_XMARK        "\xef\x81\x97"  // U+F057
#define ICON_FA_TRIANGLE_EXCLAMATION "\xef\x81\xb1" // U+F071
#define ICON_FA_CHECK               "\xef\x80\x8c"  // U+F00C
