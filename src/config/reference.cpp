#include "httpconf/config/reference.hpp"

namespace httpconf {

namespace {

constexpr std::string_view kDefaultMimeTypes = R"(
# Text
txt=text/plain
text=text/plain
htm=text/html
html=text/html
shtml=text/html
css=text/css
csv=text/csv
tsv=text/tab-separated-values
md=text/markdown
ics=text/calendar
vtt=text/vtt
xml=application/xml
xsl=application/xml
xslt=application/xslt+xml
js=text/javascript
mjs=text/javascript

# Application
json=application/json
jsonld=application/ld+json
map=application/json
webmanifest=application/manifest+json
pdf=application/pdf
rtf=application/rtf
wasm=application/wasm
bin=application/octet-stream
exe=application/octet-stream
dll=application/octet-stream
zip=application/zip
gz=application/gzip
tgz=application/gzip
tar=application/x-tar
bz2=application/x-bzip2
7z=application/x-7z-compressed
rar=application/vnd.rar
jar=application/java-archive
doc=application/msword
docx=application/vnd.openxmlformats-officedocument.wordprocessingml.document
xls=application/vnd.ms-excel
xlsx=application/vnd.openxmlformats-officedocument.spreadsheetml.sheet
ppt=application/vnd.ms-powerpoint
pptx=application/vnd.openxmlformats-officedocument.presentationml.presentation
odt=application/vnd.oasis.opendocument.text
ods=application/vnd.oasis.opendocument.spreadsheet
epub=application/epub+zip
atom=application/atom+xml
rss=application/rss+xml
xhtml=application/xhtml+xml
sh=application/x-sh

# Images
png=image/png
jpg=image/jpeg
jpeg=image/jpeg
gif=image/gif
bmp=image/bmp
ico=image/x-icon
svg=image/svg+xml
svgz=image/svg+xml
webp=image/webp
avif=image/avif
tif=image/tiff
tiff=image/tiff
heic=image/heic

# Fonts
woff=font/woff
woff2=font/woff2
ttf=font/ttf
otf=font/otf
eot=application/vnd.ms-fontobject

# Audio
mp3=audio/mpeg
ogg=audio/ogg
oga=audio/ogg
wav=audio/wav
weba=audio/webm
flac=audio/flac
aac=audio/aac
m4a=audio/mp4
mid=audio/midi
midi=audio/midi

# Video
mp4=video/mp4
m4v=video/mp4
webm=video/webm
ogv=video/ogg
mov=video/quicktime
avi=video/x-msvideo
mpeg=video/mpeg
mpg=video/mpeg
mkv=video/x-matroska
ts=video/mp2t
3gp=video/3gpp
)";

Configuration build_reference() {
    return Configuration::from_pairs({
        {"http.context", "/"},

        {"http.parser.maxMemoryBuffer", "100k"},
        {"http.parser.maxDiskBuffer", "10m"},
        {"http.parser.allowEmptyFiles", false},

        {"http.actionComposition.controllerAnnotationsFirst", false},
        {"http.actionComposition.executeActionCreatorActionFirst", false},
        {"http.actionComposition.includeWebSocketActions", false},

        {"http.cookies.strict", true},

        {"http.session.cookieName", "APP_SESSION"},
        {"http.session.secure", false},
        {"http.session.maxAge", nullptr},
        {"http.session.httpOnly", true},
        {"http.session.domain", nullptr},
        {"http.session.path", "/"},
        {"http.session.sameSite", "lax"},
        {"http.session.partitioned", false},
        {"http.session.jwt.signatureAlgorithm", "HS256"},
        {"http.session.jwt.expiresAfter", nullptr},
        {"http.session.jwt.clockSkew", "5 minutes"},
        {"http.session.jwt.dataClaim", "data"},

        {"http.flash.cookieName", "APP_FLASH"},
        {"http.flash.secure", false},
        {"http.flash.httpOnly", true},
        {"http.flash.domain", nullptr},
        {"http.flash.path", "/"},
        {"http.flash.sameSite", "lax"},
        {"http.flash.partitioned", false},
        {"http.flash.jwt.signatureAlgorithm", "HS256"},
        {"http.flash.jwt.expiresAfter", nullptr},
        {"http.flash.jwt.clockSkew", "5 minutes"},
        {"http.flash.jwt.dataClaim", "data"},

        {"http.fileMimeTypes", kDefaultMimeTypes},

        {"http.secret.key", "changeme"},
        {"http.secret.provider", nullptr},
    });
}

} // anonymous namespace

const Configuration& reference_configuration() {
    static const Configuration reference = build_reference();
    return reference;
}

std::string_view default_file_mime_types() noexcept {
    return kDefaultMimeTypes;
}

} // namespace httpconf
