#pragma once

#include "types/context.hpp"

/**
 * @brief A layer drawn once per frame.
 */
class IRenderer {
  public:
    virtual ~IRenderer() = default;
    virtual void render(Context &ctx) = 0;
};
