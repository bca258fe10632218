#include "PopupTypes.hpp"

std::string popupStyleName(PopupStyle style)
{
    switch (style)
    {
        case PopupStyle::None:
            return "none";
        case PopupStyle::Simple:
            return "simple";
        case PopupStyle::Bordered:
            return "bordered";
        case PopupStyle::Light:
            return "light";
        case PopupStyle::Dark:
            return "dark";
    }
    return "none";
}
