/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Common macros for ddns

**************************************************/

#ifndef DDNS_MACRO_HPP
#define DDNS_MACRO_HPP

#define DDNS_FILE_NAME __FILE__
#define DDNS_FILE_LINE __LINE__
#define DDNS_FUNC_NAME __func__

#define DDNS_NODISCARD [[nodiscard]]

#endif  // DDNS_MACRO_HPP
