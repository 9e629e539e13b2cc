#include <serial-actor/src.hpp>
