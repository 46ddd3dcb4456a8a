#pragma once

#define SNIPBOX_STRINGIZE_IMPL(x) #x
#define SNIPBOX_STRINGIZE(x) SNIPBOX_STRINGIZE_IMPL(x)
