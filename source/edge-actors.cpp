#include <edge-actors/src.hpp>
