#include "chatpack/normalizer.hpp"
#include "../test_util.hpp"
#include <string>

using cp_test::check;
using cp_test::check_eq;

int main(){
  cp::Normalizer norm(true);

  {
    cp::TelegramRecord r;
    r.kind = "message"; r.from = "Alice"; r.text = "Hello"; r.id = 1; r.date = 1000; r.reply_to = 9; r.edited = 2000;
    auto m = norm.normalize(r);
    if (check(m.has_value(), "telegram message kept")) {
      check_eq(m->sender, std::string("Alice"), "telegram sender");
      check(m->id && *m->id == 1u, "telegram id");
      check(m->reply_to && *m->reply_to == 9u, "telegram reply");
      check(m->edited && *m->edited == 2000, "telegram edited");
    }
    cp::TelegramRecord svc = r; svc.kind = "service";
    check(!norm.normalize(svc).has_value(), "service dropped");
    cp::TelegramRecord anon = r; anon.from.reset();
    check(!norm.normalize(anon).has_value(), "no sender dropped");
    cp::TelegramRecord empty = r; empty.text = " \n\t";
    check(!norm.normalize(empty).has_value(), "blank text dropped");
  }

  {
    cp::WhatsAppRecord r{"Bob", "  First line\nsecond line  \n", 5000};
    auto m = norm.normalize(r);
    if (check(m.has_value(), "whatsapp kept")) {
      check_eq(m->content, std::string("First line\nsecond line"), "whatsapp trimmed");
      check(!m->id.has_value(), "whatsapp has no id");
    }
    cp::WhatsAppRecord sys{"Bob", "Bob added Carol", 5000};
    check(!norm.normalize(sys).has_value(), "system line dropped");
    cp::Normalizer keep_all(false);
    check(keep_all.normalize(sys).has_value(), "system line kept when not skipping");
    cp::WhatsAppRecord media{"Bob", "", 5000};
    check(!keep_all.normalize(media).has_value(), "empty content dropped");
  }

  {
    cp::InstagramRecord r{"Carol", "hi", 7};
    auto m = norm.normalize(r);
    check(m && m->content == "hi" && m->timestamp && *m->timestamp == 7, "instagram kept");
    cp::InstagramRecord blank{"Carol", "   ", 7};
    check(!norm.normalize(blank).has_value(), "instagram blank dropped");
  }

  {
    cp::DiscordRecord r;
    r.id = 11; r.sender = "dave"; r.content = ""; r.timestamp = 9;
    r.attachments = {"photo.jpg"};
    r.stickers = {"wave"};
    auto m = norm.normalize(r);
    if (check(m.has_value(), "attachment-only message kept"))
      check_eq(m->content, std::string("[Attachment: photo.jpg]\n[Sticker: wave]"), "placeholders");
    cp::DiscordRecord t; t.sender = "dave"; t.content = "look";
    t.attachments = {"a.png"};
    check_eq(cp::discord_content(t), std::string("look\n[Attachment: a.png]"), "text then placeholder");
    cp::DiscordRecord e; e.sender = "dave";
    check(!norm.normalize(e).has_value(), "discord empty dropped");

    cp::Normalizer text_only(true, false);
    check(!text_only.normalize(r).has_value(), "attachment-only dropped without placeholders");
    auto tm = text_only.normalize(t);
    check(tm && tm->content == "look", "text kept without placeholders");
  }

  return cp_test::finish("normalizer");
}
