#include "Config.hpp"

#include "NinePatchPainter.hpp"
#include "PopupTypes.hpp"

namespace config
{

    void registerPopupStyles(ItemFactory<PopupPainter>& factory)
    {
        for (PopupStyle style : {PopupStyle::Simple, PopupStyle::Bordered, PopupStyle::Light, PopupStyle::Dark})
        {
            const std::string name = popupStyleName(style);
            factory.registerItem(name, [name]() -> std::unique_ptr<PopupPainter> {
                return std::make_unique<NinePatchPainter>(popupStyleResource(name));
            });
        }
    }

    QString popupStyleResource(const std::string& styleName)
    {
        return QStringLiteral(":/popup/%1.9.png").arg(QString::fromStdString(styleName));
    }

} // namespace config
