#include <algorithm>
#include "blocked_services.h"

namespace dg {

// Domains are listed with the top-level domains the services actually use
const std::vector<blocked_services::service> &blocked_services::all() {
    static const std::vector<service> SERVICES = {
            {"whatsapp", {"||whatsapp.com^", "||whatsapp.net^"}},
            {"facebook", {
                    "||facebook.com^",
                    "||facebook.net^",
                    "||fbcdn.net^",
                    "||fbcdn.com^",
                    "||fb.com^",
                    "||fb.me^",
                    "||fbsbx.com^",
                    "||messenger.com^",
                    "||m.me^",
                    "||tfbnw.net^",
                    "||oculus.com^",
                    "||giphy.com^",
            }},
            {"twitter", {"||twitter.com^", "||twttr.com^", "||t.co^", "||twimg.com^", "||ads-twitter.com^"}},
            {"youtube", {
                    "||youtube.com^",
                    "||ytimg.com^",
                    "||youtu.be^",
                    "||googlevideo.com^",
                    "||youtubei.googleapis.com^",
                    "||youtube-nocookie.com^",
            }},
            {"twitch", {"||twitch.tv^", "||ttvnw.net^", "||jtvnw.net^", "||twitchcdn.net^"}},
            {"netflix", {"||nflxext.com^", "||netflix.com^", "||netflix.net^", "||nflximg.net^", "||nflxvideo.net^"}},
            {"instagram", {"||instagram.com^", "||cdninstagram.com^", "||instagram-brand.com^"}},
            {"snapchat", {"||snapchat.com^", "||sc-cdn.net^", "||snap-dev.net^", "||snapkit.co^", "||snapads.com^"}},
            {"discord", {"||discordapp.com^", "||discordapp.net^", "||discord.com^", "||discord.gg^"}},
            {"ok", {"||ok.ru^"}},
            {"skype", {"||skype.com^", "||skypeassets.com^"}},
            {"vk", {"||vk.com^", "||userapi.com^", "||vk-cdn.net^", "||vkuservideo.net^"}},
            {"origin", {"||origin.com^", "||signin.ea.com^", "||accounts.ea.com^"}},
            {"steam", {
                    "||steam.com^",
                    "||steampowered.com^",
                    "||steamcommunity.com^",
                    "||steamstatic.com^",
                    "||steamstore-a.akamaihd.net^",
                    "||steamcdn-a.akamaihd.net^",
            }},
            {"epic_games", {"||epicgames.com^", "||easyanticheat.net^", "||easy.ac^", "||eac-cdn.com^"}},
            {"reddit", {"||reddit.com^", "||redditstatic.com^", "||redditmedia.com^", "||redd.it^"}},
            {"mail_ru", {"||mail.ru^"}},
            {"cloudflare", {
                    "||cloudflare.com^",
                    "||cloudflare.net^",
                    "||cloudflare-dns.com^",
                    "||cloudflareinsights.com^",
                    "||cloudflarestream.com^",
                    "||one.one.one.one^",
            }},
            {"amazon", {
                    "||amazon.com^",
                    "||media-amazon.com^",
                    "||primevideo.com^",
                    "||amazontrust.com^",
                    "||images-amazon.com^",
                    "||amazonvideo.com^",
                    "||ssl-images-amazon.com^",
                    "||amazonpay.com^",
                    "||amazon-adsystem.com^",
            }},
            {"ebay", {"||ebay.com^", "||ebayimg.com^", "||ebaystatic.com^", "||ebaycdn.net^", "||ebayinc.com^"}},
            {"tiktok", {
                    "||tiktok.com^",
                    "||tiktokcdn.com^",
                    "||tiktokv.com^",
                    "||musical.ly^",
                    "||snssdk.com^",
                    "||byteoversea.com^",
                    "||ibytedtos.com^",
                    "||muscdn.com^",
            }},
    };
    return SERVICES;
}

const blocked_services::service *blocked_services::find(std::string_view id) {
    const std::vector<service> &services = all();
    auto it = std::find_if(services.begin(), services.end(), [id] (const service &s) { return s.id == id; });
    return (it != services.end()) ? &*it : nullptr;
}

} // namespace dg
